#include "typing_trainer/text_provider.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <stdexcept>

#include "typing_trainer/string_util.hpp"

namespace tt::trainer {

namespace {

std::string toLower(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (char ch : value) {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    return out;
}

bool isLowercaseWord(const std::string& word) {
    return std::all_of(word.begin(), word.end(), [](char ch) { return ch >= 'a' && ch <= 'z'; });
}

}  // namespace

std::optional<TextSource> parseTextSource(std::string_view value) {
    const auto lowered = toLower(value);
    if (lowered == "google" || lowered == "google10k" || lowered == "top10k") {
        return TextSource::Google;
    }
    if (lowered == "system" || lowered == "dict" || lowered == "dictionary") {
        return TextSource::System;
    }
    if (lowered == "builtin" || lowered == "built-in" || lowered == "samples") {
        return TextSource::Builtin;
    }
    return std::nullopt;
}

std::string_view textSourceName(TextSource source) {
    switch (source) {
        case TextSource::Google: return "google";
        case TextSource::System: return "system";
        case TextSource::Builtin: return "builtin";
    }
    return "builtin";
}

std::vector<std::string> filterWords(const std::vector<std::string>& lines,
                                     std::size_t max_word_length) {
    std::vector<std::string> words;
    for (const auto& line : lines) {
        std::string word = trim(line);
        if (word.size() < kMinWordLength || word.size() > max_word_length) {
            continue;
        }
        if (!isLowercaseWord(word)) {
            continue;
        }
        words.push_back(std::move(word));
    }
    return words;
}

TextProvider::TextProvider(TextCorpusPtr corpus)
    : TextProvider(std::move(corpus), std::random_device{}()) {}

TextProvider::TextProvider(TextCorpusPtr corpus, std::uint32_t seed)
    : corpus_(std::move(corpus)), rng_(seed) {
    if (!corpus_ || corpus_->excerpts.empty()) {
        throw std::invalid_argument("TextProvider requires a corpus with built-in excerpts");
    }
}

void TextProvider::setWarningSink(WarningSink sink) {
    warning_sink_ = std::move(sink);
}

GeneratedText TextProvider::generate(TextSource source, std::size_t max_word_length) {
    switch (source) {
        case TextSource::Google: {
            auto words = filterWords(corpus_->top_words, max_word_length);
            if (words.empty()) {
                return fallback("embedded word list has no words up to length " +
                                std::to_string(max_word_length));
            }
            return GeneratedText{joinUntilThreshold(words), TextSource::Google};
        }
        case TextSource::System: {
            std::vector<std::string> words;
            try {
                words = filterWords(readDictionary(), max_word_length);
            } catch (const std::runtime_error& err) {
                return fallback(err.what());
            }
            if (words.empty()) {
                return fallback("no usable words in " + corpus_->dictionary_path.string());
            }
            return GeneratedText{joinUntilThreshold(words), TextSource::System};
        }
        case TextSource::Builtin:
            break;
    }
    return GeneratedText{joinUntilThreshold(corpus_->excerpts), TextSource::Builtin};
}

GeneratedText TextProvider::fallback(const std::string& reason) {
    warn("Warning: " + reason + ". Using built-in texts.");
    return GeneratedText{joinUntilThreshold(corpus_->excerpts), TextSource::Builtin};
}

std::vector<std::string> TextProvider::readDictionary() const {
    std::ifstream in(corpus_->dictionary_path);
    if (!in) {
        throw std::runtime_error("Could not load dictionary from " +
                                 corpus_->dictionary_path.string());
    }
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(std::move(line));
    }
    return lines;
}

std::string TextProvider::joinUntilThreshold(const std::vector<std::string>& tokens) {
    std::uniform_int_distribution<std::size_t> pick(0, tokens.size() - 1);
    std::string text;
    while (text.size() < kMinTextLength) {
        if (!text.empty()) {
            text.push_back(' ');
        }
        text += tokens[pick(rng_)];
    }
    return text;
}

void TextProvider::warn(const std::string& message) const {
    if (warning_sink_) {
        warning_sink_(message);
        return;
    }
    std::cerr << "[TextProvider] " << message << '\n';
}

}  // namespace tt::trainer
