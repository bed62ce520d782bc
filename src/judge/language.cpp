#include "judge/language.hpp"
#include <boost/algorithm/string/replace.hpp>
#include <regex>
#include "common/exceptions.hpp"

namespace codejudge {
using namespace std;

static const string BITS_HEADER_EXPANSION =
    "#include <iostream>\n"
    "#include <vector>\n"
    "#include <string>\n"
    "#include <algorithm>\n"
    "#include <map>\n"
    "#include <set>\n"
    "#include <queue>\n"
    "#include <stack>\n"
    "#include <cmath>\n"
    "#include <cstring>\n"
    "#include <cstdio>\n"
    "#include <cstdlib>\n"
    "#include <climits>\n"
    "#include <cassert>\n"
    "#include <numeric>\n"
    "#include <unordered_map>\n"
    "#include <unordered_set>\n"
    "#include <bitset>\n"
    "#include <limits>\n";

string expand_bits_header(const string &code) {
    static const regex bits_header(R"(#include\s*<bits/stdc\+\+\.h>)");
    return regex_replace(code, bits_header, BITS_HEADER_EXPANSION);
}

optional<string> find_java_class_name(const string &code) {
    static const regex class_decl(R"(class\s+(\w+))");
    smatch match;
    if (!regex_search(code, match, class_decl)) return nullopt;
    return match[1].str();
}

string expand_placeholders(const string &text, const map<string, string> &vars) {
    string result = text;
    for (auto &[key, value] : vars)
        boost::algorithm::replace_all(result, "{" + key + "}", value);
    return result;
}

vector<string> expand_command(const vector<string> &command, const map<string, string> &vars) {
    vector<string> result;
    for (auto &arg : command) result.push_back(expand_placeholders(arg, vars));
    return result;
}

/**
 * @brief JVM（javac 与 java）需要的最少进程数
 */
static const int JAVA_PROC_LIMIT = 128;

// clang-format off
static const map<string, toolchain_profile> profiles = {
    {"python", toolchain_profile{
        "python", "solution.py", execution_strategy::INTERPRETED,
        {},
        {"{python}", "solution.py"},
        "python:3.11-slim", nullptr, false}},
    {"cpp", toolchain_profile{
        "cpp", "solution.cpp", execution_strategy::COMPILED,
        {"g++", "-std=c++14", "-O2", "-o", "solution", "solution.cpp"},
        {"./solution"},
        "gcc:latest", expand_bits_header, false}},
    {"c", toolchain_profile{
        "c", "solution.c", execution_strategy::COMPILED,
        {"gcc", "-O2", "-o", "solution", "solution.c"},
        {"./solution"},
        "gcc:latest", nullptr, false}},
    {"java", toolchain_profile{
        "java", "{class}.java", execution_strategy::COMPILED,
        {"javac", "{class}.java"},
        {"java", "{class}"},
        "openjdk:17-jdk-slim", nullptr, true, JAVA_PROC_LIMIT}}};
// clang-format on

const toolchain_profile &find_language(const string &language) {
    auto it = profiles.find(language);
    if (it == profiles.end()) throw unsupported_language(language);
    return it->second;
}

vector<string> supported_languages() {
    vector<string> result;
    for (auto &[language, profile] : profiles) result.push_back(language);
    return result;
}

}  // namespace codejudge
