#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "judge/language.hpp"

using namespace std;
using namespace codejudge;

TEST(LanguageTest, KnownProfiles) {
    EXPECT_EQ(find_language("python").strategy, execution_strategy::INTERPRETED);
    EXPECT_TRUE(find_language("python").compile_command.empty());
    EXPECT_EQ(find_language("cpp").strategy, execution_strategy::COMPILED);
    EXPECT_EQ(find_language("cpp").source_filename, "solution.cpp");
    EXPECT_EQ(find_language("c").compile_command.front(), "gcc");
    EXPECT_TRUE(find_language("java").needs_class_name);
    EXPECT_GE(find_language("java").min_proc_limit, 64);
    EXPECT_EQ(find_language("python").min_proc_limit, 0);
    EXPECT_EQ(supported_languages(), vector<string>({"c", "cpp", "java", "python"}));
}

TEST(LanguageTest, UnsupportedLanguage) {
    try {
        find_language("brainfuck");
        FAIL() << "brainfuck should not be supported";
    } catch (unsupported_language &ex) {
        EXPECT_EQ(ex.language, "brainfuck");
        EXPECT_STREQ(ex.what(), "Unsupported language: brainfuck");
    }
}

TEST(LanguageTest, ExpandBitsHeader) {
    string code = "#include<bits/stdc++.h>\nusing namespace std;\nint main() {}\n";
    string expanded = expand_bits_header(code);
    EXPECT_EQ(expanded.find("bits/stdc++.h"), string::npos);
    EXPECT_NE(expanded.find("#include <iostream>\n"), string::npos);
    EXPECT_NE(expanded.find("#include <unordered_map>\n"), string::npos);
    EXPECT_NE(expanded.find("using namespace std;"), string::npos);

    EXPECT_EQ(expand_bits_header("#include <bits/stdc++.h>").find("bits"), string::npos);
    EXPECT_EQ(expand_bits_header("#include <vector>\n"), "#include <vector>\n");
}

TEST(LanguageTest, CppProfileRewritesSource) {
    auto &profile = find_language("cpp");
    ASSERT_TRUE(profile.rewrite);
    EXPECT_EQ(profile.rewrite("#include<bits/stdc++.h>").find("bits"), string::npos);
    EXPECT_FALSE(find_language("c").rewrite);
}

TEST(LanguageTest, FindJavaClassName) {
    EXPECT_EQ(find_java_class_name("public class Main {\n}"), "Main");
    EXPECT_EQ(find_java_class_name("import java.util.*;\nclass  Solution{ }\nclass Helper {}"), "Solution");
    EXPECT_FALSE(find_java_class_name("interface Foo {}").has_value());
}

TEST(LanguageTest, ExpandCommand) {
    map<string, string> vars = {{"class", "Main"}, {"python", "python3"}};
    EXPECT_EQ(expand_command(find_language("java").run_command, vars), vector<string>({"java", "Main"}));
    EXPECT_EQ(expand_command(find_language("python").run_command, vars), vector<string>({"python3", "solution.py"}));
    EXPECT_EQ(expand_placeholders(find_language("java").source_filename, vars), "Main.java");
    EXPECT_EQ(expand_placeholders("{unknown}", vars), "{unknown}");
}
