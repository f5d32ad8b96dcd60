// Tests for UTF-8 sanitizing and the shutdown token.

#include "utils/shutdown_token.hpp"
#include "utils/utf8_sanitize.hpp"

#include <nlohmann/json.hpp>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>

using json = nlohmann::json;

namespace test_utils {

static bool check(bool condition, const std::string &description) {
    std::cout << (condition ? "  OK: " : "  FAIL: ") << description << std::endl;
    return condition;
}

static bool test_valid_text_is_untouched() {
    const std::string text = "plain ascii, \xC3\xA9t\xC3\xA9, \xE2\x82\xAC, \xF0\x9F\x98\x80";
    return check(utf8_sanitize::sanitize(text) == text, "valid UTF-8 passes through unchanged");
}

static bool test_invalid_sequences_replaced() {
    const std::string replacement = "\xEF\xBF\xBD";
    bool success = true;
    success &= check(utf8_sanitize::sanitize(std::string("a\xFF" "b")) == "a" + replacement + "b",
                     "stray 0xFF is replaced");
    success &= check(utf8_sanitize::sanitize(std::string("\xC0\xAF")) == replacement + replacement,
                     "overlong encoding is replaced");
    success &= check(utf8_sanitize::sanitize(std::string("\xED\xA0\x80")) == replacement + replacement + replacement,
                     "surrogate code point is replaced");
    success &= check(utf8_sanitize::sanitize(std::string("end\xE2\x82")) == "end" + replacement + replacement,
                     "truncated sequence at the end is replaced");

    std::string in_place("tail\xFF");
    utf8_sanitize::sanitize(in_place);
    success &= check(in_place == "tail" + replacement, "in-place overload rewrites its argument");

    std::string sanitized = utf8_sanitize::sanitize(std::string("x\x80\xBFy"));
    bool dumps = true;
    try {
        json value = sanitized;
        (void)value.dump();
    } catch (const json::type_error &) {
        dumps = false;
    }
    success &= check(dumps, "sanitized text serializes with nlohmann::json");
    return success;
}

static bool test_snippet() {
    std::string long_text(500, 'x');
    std::string cut = utf8_sanitize::snippet(long_text, 200);
    bool success = check(cut.size() == 203 && cut.substr(200) == "...", "snippet cuts to the limit and marks it");

    // Two-byte characters: a cut at an odd offset must back up to a boundary.
    std::string accented;
    for (int index = 0; index < 10; ++index) {
        accented += "\xC3\xA9";
    }
    std::string accented_cut = utf8_sanitize::snippet(accented, 5);
    success &= check(accented_cut == "\xC3\xA9\xC3\xA9...", "snippet never splits a code point");
    success &= check(utf8_sanitize::snippet("short", 200) == "short", "short text is returned whole");
    return success;
}

static bool test_shutdown_token() {
    shutdown_token::ShutdownToken token;
    auto start = std::chrono::steady_clock::now();
    bool requested = token.sleep_for(std::chrono::milliseconds(120));
    long waited = static_cast<long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count());
    bool success = check(!requested && waited >= 100, "sleep_for runs to the end without a request");

    std::thread requester([&token]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        token.request();
    });
    start = std::chrono::steady_clock::now();
    requested = token.sleep_for(std::chrono::milliseconds(10000));
    waited = static_cast<long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count());
    requester.join();
    success &= check(requested && waited < 2000 && token.is_requested(), "sleep_for wakes early on request");
    return success;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_valid_text_is_untouched();
    all_passed &= test_invalid_sequences_replaced();
    all_passed &= test_snippet();
    all_passed &= test_shutdown_token();
    return all_passed;
}

} // namespace test_utils
