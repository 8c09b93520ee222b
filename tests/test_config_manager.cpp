/* test_config_manager.cpp - configuration file tests.
 *
 * Outliner.
 * Copyright (c) 2025 Quin Gillespie.
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this software and associated documentation files (the "Software"), to deal in the Software without restriction, including without limitation the rights to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons to whom the Software is furnished to do so, subject to the following conditions:
 * The above copyright notice and this permission notice shall be included in all copies or substantial portions of the Software.
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include "config_manager.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <wx/fileconf.h>

namespace {
class config_manager_test : public temp_dir_test {};
} // namespace

TEST_F(config_manager_test, WritesDefaultsOnFirstRun) {
	const wxString path = path_in("settings/outliner.ini");
	{
		config_manager config;
		ASSERT_TRUE(config.initialize(path));
		EXPECT_TRUE(config.is_initialized());
		EXPECT_EQ(config.get_path(), path);
		EXPECT_EQ(config.get(config_manager::max_toc_pages), DEFAULT_MAX_TOC_PAGES);
		EXPECT_EQ(config.get(config_manager::default_strategy), DEFAULT_STRATEGY);
		EXPECT_EQ(config.get(config_manager::output_dir), DEFAULT_OUTPUT_DIR);
		EXPECT_EQ(config.get(config_manager::config_version), CONFIG_VERSION_CURRENT);
	}
	ASSERT_TRUE(wxFileName::FileExists(path));
	const std::string content = read_file(path);
	EXPECT_NE(content.find("[app]"), std::string::npos);
	EXPECT_NE(content.find("max_toc_pages=8"), std::string::npos);
	EXPECT_NE(content.find("strategy=auto"), std::string::npos);
}

TEST_F(config_manager_test, ValuesSurviveReopening) {
	const wxString path = path_in("outliner.ini");
	{
		config_manager config;
		ASSERT_TRUE(config.initialize(path));
		config.set(config_manager::max_toc_pages, 3);
		config.set(config_manager::default_strategy, wxString("headings"));
		config.shutdown();
		EXPECT_FALSE(config.is_initialized());
	}
	config_manager reopened;
	ASSERT_TRUE(reopened.initialize(path));
	EXPECT_EQ(reopened.get(config_manager::max_toc_pages), 3);
	EXPECT_EQ(reopened.get(config_manager::default_strategy), "headings");
	EXPECT_EQ(reopened.get(config_manager::output_dir), DEFAULT_OUTPUT_DIR);
}

TEST_F(config_manager_test, ReadsHandWrittenFile) {
	const wxString path = path_in("custom.ini");
	write_file(path, "[app]\nmax_toc_pages=12\noutput_dir=reports/out\n");
	config_manager config;
	ASSERT_TRUE(config.initialize(path));
	EXPECT_EQ(config.get(config_manager::max_toc_pages), 12);
	EXPECT_EQ(config.get(config_manager::output_dir), "reports/out");
	EXPECT_EQ(config.get(config_manager::default_strategy), DEFAULT_STRATEGY);
}

TEST(ConfigManagerTest, UninitializedReturnsDefaults) {
	const config_manager config{};
	EXPECT_FALSE(config.is_initialized());
	EXPECT_EQ(config.get(config_manager::max_toc_pages), DEFAULT_MAX_TOC_PAGES);
	EXPECT_EQ(config.get(config_manager::default_strategy), DEFAULT_STRATEGY);
}

TEST_F(config_manager_test, RepairsOutOfRangeValues) {
	const wxString path = path_in("broken.ini");
	write_file(path, "[app]\nmax_toc_pages=0\noutput_dir=\n");
	config_manager config;
	ASSERT_TRUE(config.initialize(path));
	EXPECT_EQ(config.get(config_manager::max_toc_pages), DEFAULT_MAX_TOC_PAGES);
	EXPECT_EQ(config.get(config_manager::output_dir), DEFAULT_OUTPUT_DIR);
}
