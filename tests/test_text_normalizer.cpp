// Automated tests for TextNormalizer rewrites

#include "text_normalizer.hpp"
#include <iostream>
#include <cassert>

using namespace reflow;

void test_space_before_punctuation() {
    std::cout << "Testing space before punctuation..." << std::endl;

    TextNormalizer norm;
    assert(norm.apply(&TextNormalizer::remove_space_before_punctuation, "今日は 。 明日 、") == "今日は。 明日、");
    assert(norm.apply(&TextNormalizer::remove_space_before_punctuation, "本当 ？") == "本当？");

    // Repeated marks collapse to one
    assert(norm.apply(&TextNormalizer::remove_space_before_punctuation, "本当。。。") == "本当。");
    assert(norm.apply(&TextNormalizer::remove_space_before_punctuation, "はい、、そう") == "はい、そう");

    std::cout << "  PASS" << std::endl;
}

void test_numbers_and_units() {
    std::cout << "Testing numbers and units..." << std::endl;

    TextNormalizer norm;
    assert(norm.apply(&TextNormalizer::join_numbers_and_units, "2024 年 3 月") == "2024年 3月");
    assert(norm.apply(&TextNormalizer::join_numbers_and_units, "3  人") == "3人");

    // Only listed units attach
    assert(norm.apply(&TextNormalizer::join_numbers_and_units, "10 ドル") == "10 ドル");

    std::cout << "  PASS" << std::endl;
}

void test_script_boundaries() {
    std::cout << "Testing script boundaries..." << std::endl;

    TextNormalizer norm;
    assert(norm.apply(&TextNormalizer::space_script_boundaries, "APIを使う") == "API を使う");
    assert(norm.apply(&TextNormalizer::space_script_boundaries, "10年") == "10年");
    assert(norm.apply(&TextNormalizer::space_script_boundaries, "10ドル") == "10 ドル");
    assert(norm.apply(&TextNormalizer::space_script_boundaries, "API を使う") == "API を使う");

    std::cout << "  PASS" << std::endl;
}

void test_filler_removal() {
    std::cout << "Testing filler removal..." << std::endl;

    TextNormalizer norm;

    // Surrounded by spaces: neighbours keep exactly one space
    assert(norm.apply(&TextNormalizer::remove_filler_words, "これは えーと テストです") == "これは テストです");

    // Leading filler with its comma
    assert(norm.apply(&TextNormalizer::remove_filler_words, "えーと、今日は晴れです") == "今日は晴れです");

    // No space left before punctuation
    assert(norm.apply(&TextNormalizer::remove_filler_words, "そうですね えー。") == "そうですね。");

    // Whole tokens only
    assert(norm.apply(&TextNormalizer::remove_filler_words, "あの人は来た") == "あの人は来た");

    std::cout << "  PASS" << std::endl;
}

void test_custom_fillers() {
    std::cout << "Testing custom filler list..." << std::endl;

    ReflowConfig config;
    config.filler_words = {"um", "uh"};
    TextNormalizer norm(config);

    assert(norm.apply(&TextNormalizer::remove_filler_words, "So Um, that works") == "So that works");
    assert(norm.apply(&TextNormalizer::remove_filler_words, "umbrella uh stand") == "umbrella stand");

    ReflowConfig no_fillers;
    no_fillers.filler_words.clear();
    TextNormalizer keep(no_fillers);
    assert(keep.apply(&TextNormalizer::remove_filler_words, "これは えーと テスト") == "これは えーと テスト");

    std::cout << "  PASS" << std::endl;
}

void test_collapse_whitespace() {
    std::cout << "Testing whitespace collapse..." << std::endl;

    TextNormalizer norm;
    assert(norm.apply(&TextNormalizer::collapse_whitespace, "  a   b  \n\n\n\n  c  ") == "a b\n\nc");
    assert(norm.apply(&TextNormalizer::collapse_whitespace, "a\nb") == "a\nb");
    assert(norm.apply(&TextNormalizer::collapse_whitespace, "\n\n  ") == "");

    std::cout << "  PASS" << std::endl;
}

void test_space_after_commas() {
    std::cout << "Testing space after commas..." << std::endl;

    TextNormalizer norm;
    assert(norm.apply(&TextNormalizer::space_after_commas, "はい、そうです") == "はい、 そうです");
    assert(norm.apply(&TextNormalizer::space_after_commas, "はい、 そうです") == "はい、 そうです");
    assert(norm.apply(&TextNormalizer::space_after_commas, "1,000円") == "1,000円");

    std::cout << "  PASS" << std::endl;
}

void test_paragraph_terminals() {
    std::cout << "Testing paragraph terminals..." << std::endl;

    TextNormalizer norm;
    assert(norm.apply(&TextNormalizer::ensure_paragraph_terminals, "今日は晴れ\n\n明日は雨。") ==
           "今日は晴れ。\n\n明日は雨。");
    assert(norm.apply(&TextNormalizer::ensure_paragraph_terminals, "終わりです、") == "終わりです。");
    assert(norm.apply(&TextNormalizer::ensure_paragraph_terminals, "本当？") == "本当？");

    ReflowConfig config;
    config.default_terminal_mark = ".";
    TextNormalizer english(config);
    assert(english.apply(&TextNormalizer::ensure_paragraph_terminals, "hello world") == "hello world.");

    std::cout << "  PASS" << std::endl;
}

void test_unpunctuated_transcript() {
    std::cout << "Testing unpunctuated transcript..." << std::endl;

    TextNormalizer norm;
    const std::string input = "今日は晴れです今日は晴れですか明日は雨でしょう";
    assert(norm.process(input) == input + "。");

    std::cout << "  PASS" << std::endl;
}

void test_idempotent() {
    std::cout << "Testing process(process(x)) == process(x)..." << std::endl;

    TextNormalizer norm;
    const std::string inputs[] = {
        "えーと、 あの 会議は 10 時からです",
        "APIを使って 、 テストする",
        "第一段落\n\n\n第二段落、",
        "これは えーと テストです。 そうですね えー。",
        "「そうですね」",
        "",
    };
    for (const auto& input : inputs) {
        const std::string once = norm.process(input);
        assert(norm.process(once) == once);
    }

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "\n=== Text Normalizer Test Suite ===" << std::endl << std::endl;

    test_space_before_punctuation();
    test_numbers_and_units();
    test_script_boundaries();
    test_filler_removal();
    test_custom_fillers();
    test_collapse_whitespace();
    test_space_after_commas();
    test_paragraph_terminals();
    test_unpunctuated_transcript();
    test_idempotent();

    std::cout << "\n=== All Tests Passed! ===" << std::endl << std::endl;
    return 0;
}
