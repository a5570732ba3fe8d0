// Automated tests for SentenceSplitter

#include "sentence_splitter.hpp"
#include "text_utils.hpp"
#include <iostream>
#include <cassert>

using namespace reflow;

// Everything except whitespace, for reconstruction checks
static std::u32string non_space(const std::string& utf8) {
    std::u32string out;
    for (char32_t c : text::decode(utf8)) {
        if (!text::is_space(c)) out += c;
    }
    return out;
}

void test_basic_split() {
    std::cout << "Testing basic split..." << std::endl;

    SentenceSplitter splitter;
    auto sentences = splitter.split("今日は晴れです。明日は雨でしょう。");
    assert(sentences.size() == 2);
    assert(sentences[0] == "今日は晴れです。");
    assert(sentences[1] == "明日は雨でしょう。");

    sentences = splitter.split("Hello there. How are you? Fine!");
    assert(sentences.size() == 3);
    assert(sentences[1] == "How are you?");

    std::cout << "  PASS" << std::endl;
}

void test_no_terminal_marks() {
    std::cout << "Testing input without terminal marks..." << std::endl;

    SentenceSplitter splitter;
    const std::string input = "今日は晴れです今日は晴れですか明日は雨でしょう";
    auto sentences = splitter.split(input);
    assert(sentences.size() == 1);
    assert(sentences[0] == input);

    std::cout << "  PASS" << std::endl;
}

void test_trailing_fragment() {
    std::cout << "Testing trailing fragment..." << std::endl;

    SentenceSplitter splitter;
    auto sentences = splitter.split("一文目です。 二文目の途中");
    assert(sentences.size() == 2);
    assert(sentences[1] == "二文目の途中");

    std::cout << "  PASS" << std::endl;
}

void test_consecutive_marks_and_quotes() {
    std::cout << "Testing consecutive marks and closing quotes..." << std::endl;

    SentenceSplitter splitter;
    auto sentences = splitter.split("本当ですか？！「はい。」そうです");
    assert(sentences.size() == 3);
    assert(sentences[0] == "本当ですか？！");
    assert(sentences[1] == "「はい。」");
    assert(sentences[2] == "そうです");

    sentences = splitter.split("Wait... what?!");
    assert(sentences.size() == 2);
    assert(sentences[0] == "Wait...");
    assert(sentences[1] == "what?!");

    std::cout << "  PASS" << std::endl;
}

void test_decimal_point() {
    std::cout << "Testing decimal point..." << std::endl;

    SentenceSplitter splitter;
    auto sentences = splitter.split("It costs 3.5 dollars. OK");
    assert(sentences.size() == 2);
    assert(sentences[0] == "It costs 3.5 dollars.");
    assert(sentences[1] == "OK");

    std::cout << "  PASS" << std::endl;
}

void test_whitespace_handling() {
    std::cout << "Testing whitespace handling..." << std::endl;

    SentenceSplitter splitter;
    assert(splitter.split("").empty());
    assert(splitter.split("   \n  ").empty());

    auto sentences = splitter.split("一行目\n二行目。");
    assert(sentences.size() == 1);
    assert(sentences[0] == "一行目 二行目。");

    std::cout << "  PASS" << std::endl;
}

void test_reconstruction() {
    std::cout << "Testing reconstruction..." << std::endl;

    SentenceSplitter splitter;
    const std::string inputs[] = {
        "今日は晴れです。明日は雨でしょう。あさっては？",
        "本当ですか？！「はい。」そうです",
        "  leading space. and\nnewlines! trailing  ",
        "。。。",
        "no marks at all",
    };

    for (const auto& input : inputs) {
        std::string joined;
        for (const auto& s : splitter.split(input)) joined += s;
        assert(non_space(joined) == non_space(input) && "Split must not lose characters");
    }

    std::cout << "  PASS" << std::endl;
}

void test_custom_terminal_marks() {
    std::cout << "Testing custom terminal marks..." << std::endl;

    ReflowConfig config;
    config.terminal_marks = "。";
    SentenceSplitter splitter(config);

    auto sentences = splitter.split("本当？ はい。");
    assert(sentences.size() == 1);

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "\n=== Sentence Splitter Test Suite ===" << std::endl << std::endl;

    test_basic_split();
    test_no_terminal_marks();
    test_trailing_fragment();
    test_consecutive_marks_and_quotes();
    test_decimal_point();
    test_whitespace_handling();
    test_reconstruction();
    test_custom_terminal_marks();

    std::cout << "\n=== All Tests Passed! ===" << std::endl << std::endl;
    return 0;
}
