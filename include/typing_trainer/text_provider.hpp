#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace tt::trainer {

inline constexpr std::size_t kMinTextLength = 500;
inline constexpr std::size_t kMinWordLength = 3;
inline constexpr std::size_t kMaxWordLengthLimit = 20;

enum class TextSource {
    Google,
    System,
    Builtin,
};

[[nodiscard]] std::optional<TextSource> parseTextSource(std::string_view value);
[[nodiscard]] std::string_view textSourceName(TextSource source);

// Static text material, loaded once and shared read-only.
struct TextCorpus {
    std::vector<std::string> top_words;
    std::vector<std::string> excerpts;
    std::filesystem::path dictionary_path{"/usr/share/dict/words"};
};

using TextCorpusPtr = std::shared_ptr<const TextCorpus>;

[[nodiscard]] TextCorpusPtr makeDefaultCorpus();

// Keeps tokens of kMinWordLength..max_word_length lowercase ASCII letters.
[[nodiscard]] std::vector<std::string> filterWords(const std::vector<std::string>& lines,
                                                   std::size_t max_word_length);

struct GeneratedText {
    std::string text;
    TextSource source{TextSource::Builtin};  // source actually used
};

class TextProvider {
public:
    using WarningSink = std::function<void(const std::string&)>;

    explicit TextProvider(TextCorpusPtr corpus);
    TextProvider(TextCorpusPtr corpus, std::uint32_t seed);

    void setWarningSink(WarningSink sink);

    // Never fails: unusable word sources fall back to the built-in excerpts.
    [[nodiscard]] GeneratedText generate(TextSource source, std::size_t max_word_length);

private:
    [[nodiscard]] std::string joinUntilThreshold(const std::vector<std::string>& tokens);
    [[nodiscard]] GeneratedText fallback(const std::string& reason);
    [[nodiscard]] std::vector<std::string> readDictionary() const;
    void warn(const std::string& message) const;

    TextCorpusPtr corpus_;
    std::mt19937 rng_;
    WarningSink warning_sink_;
};

}  // namespace tt::trainer
