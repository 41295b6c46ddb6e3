// test_log_gtest.cpp - Unit tests for log categories and rule configuration

#include <gtest/gtest.h>
#include "../lib/log.h"
#include <cstdio>
#include <string>

class LogTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_init(NULL);
    }

    void TearDown() override {
        log_fini();
    }

    static std::string read_all(FILE* f) {
        rewind(f);
        std::string out;
        char buf[256];
        size_t n;
        while ((n = fread(buf, 1, sizeof(buf), f)) > 0) {
            out.append(buf, n);
        }
        return out;
    }
};

TEST_F(LogTest, LevelNames) {
    EXPECT_STREQ(log_level_to_string(LOG_LEVEL_DEBUG), "DEBUG");
    EXPECT_STREQ(log_level_to_string(LOG_LEVEL_FATAL), "FATAL");
    EXPECT_STREQ(log_level_to_string(7), "UNKNOWN");

    EXPECT_EQ(log_level_from_string("debug"), LOG_LEVEL_DEBUG);
    EXPECT_EQ(log_level_from_string("WARN"), LOG_LEVEL_WARN);
    EXPECT_EQ(log_level_from_string("Notice"), LOG_LEVEL_NOTICE);
    EXPECT_EQ(log_level_from_string("LOUD"), -1);
    EXPECT_EQ(log_level_from_string("DEBUGX"), -1);
    EXPECT_EQ(log_level_from_string(NULL), -1);
}

TEST_F(LogTest, DefaultCategory) {
    ASSERT_NE(log_default_category, nullptr);
    EXPECT_STREQ(log_default_category->name, "default");
    EXPECT_EQ(log_default_category->level, LOG_LEVEL_INFO);
    EXPECT_FALSE(log_level_enabled(log_default_category, LOG_LEVEL_DEBUG));
    EXPECT_TRUE(log_level_enabled(log_default_category, LOG_LEVEL_ERROR));
}

TEST_F(LogTest, SameCategoryReturnedByName) {
    log_category_t* a = log_get_category("docpath.transform");
    log_category_t* b = log_get_category("docpath.transform");
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a, b);
    EXPECT_EQ(log_get_category(""), nullptr);
    EXPECT_EQ(log_get_category(NULL), nullptr);
}

TEST_F(LogTest, WritesAboveLevelOnly) {
    FILE* out = tmpfile();
    ASSERT_NE(out, nullptr);
    log_category_t* cat = log_get_category("test.write");
    log_set_output(cat, out);
    log_set_level(cat, LOG_LEVEL_WARN);

    EXPECT_EQ(clog_info(cat, "hidden %d", 1), LOG_LEVEL_TOO_LOW);
    EXPECT_EQ(clog_warn(cat, "shown %d", 2), LOG_OK);

    std::string text = read_all(out);
    fclose(out);
    EXPECT_EQ(text.find("hidden"), std::string::npos);
    EXPECT_NE(text.find("WARN   [test.write] shown 2"), std::string::npos) << text;
}

TEST_F(LogTest, ConfigRules) {
    const char* config =
        "# docpath logging\n"
        "[global]\n"
        "ignored = true\n"
        "[rules]\n"
        "*.WARN               >stderr\n"
        "docpath.transform.DEBUG  >stdout\n";
    ASSERT_EQ(log_parse_config_string(config), LOG_OK);

    log_category_t* transform = log_get_category("docpath.transform");
    EXPECT_EQ(transform->level, LOG_LEVEL_DEBUG);
    EXPECT_EQ(transform->output, stdout);

    // categories created before and after the config both follow "*"
    EXPECT_EQ(log_default_category->level, LOG_LEVEL_WARN);
    log_category_t* other = log_get_category("docpath.other");
    EXPECT_EQ(other->level, LOG_LEVEL_WARN);
    EXPECT_EQ(other->output, stderr);
}

TEST_F(LogTest, MalformedConfigKeepsPreviousRules) {
    ASSERT_EQ(log_parse_config_string("[rules]\n*.ERROR >stderr\n"), LOG_OK);
    EXPECT_EQ(log_default_category->level, LOG_LEVEL_ERROR);

    EXPECT_EQ(log_parse_config_string("[rules]\n*.DEBUG >stderr\nfoo.LOUD >stdout\n"), LOG_WRONG_FORMAT);
    EXPECT_EQ(log_parse_config_string("[rules]\nfoo.DEBUG >nowhere\n"), LOG_WRONG_FORMAT);
    EXPECT_EQ(log_parse_config_string("[rules]\nnolevel >stdout\n"), LOG_WRONG_FORMAT);
    EXPECT_EQ(log_parse_config_string(NULL), LOG_WRONG_FORMAT);

    EXPECT_EQ(log_default_category->level, LOG_LEVEL_ERROR);
}

TEST_F(LogTest, MissingConfigFile) {
    EXPECT_EQ(log_parse_config_file("/nonexistent/docpath-log.conf"), LOG_INIT_FAIL);
    EXPECT_EQ(log_parse_config_file(NULL), LOG_INIT_FAIL);
}

TEST_F(LogTest, InitResetsRules) {
    ASSERT_EQ(log_parse_config_string("[rules]\n*.FATAL >stderr\n"), LOG_OK);
    EXPECT_EQ(log_default_category->level, LOG_LEVEL_FATAL);
    ASSERT_EQ(log_init(NULL), LOG_OK);
    EXPECT_EQ(log_default_category->level, LOG_LEVEL_INFO);
}
