#ifndef RUNE_DEVICE_MORSE_CODEC_HPP
#define RUNE_DEVICE_MORSE_CODEC_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace rune::device {

/// One classified interval of a keyed signal.
enum class MorseSymbol {
    Dot,
    Dash,
    IntraCharGap,
    InterCharGap,
    InterWordGap
};

/// The dot/dash pattern of one character, e.g. ".-" for 'A'.
struct MorseToken {
    std::string pattern;
    bool        ends_word = false;   // an inter-word gap followed this token
};

/// International Morse alphabet: letters, digits and common punctuation.
///
/// Immutable after construction; forward and reverse lookups are built from
/// the same entry list so every pattern maps back to exactly one character.
class MorseTable {
public:
    MorseTable();

    /// Pattern for `c` (case-insensitive), or nullptr if `c` has none.
    const char* lookup(char c) const;

    /// Character for `pattern`, or '\0' if the pattern is not in the table.
    char reverse_lookup(std::string_view pattern) const;

    /// All (character, pattern) entries in table order.
    const std::vector<std::pair<char, const char*>>& entries() const noexcept {
        return entries_;
    }

    std::size_t size() const noexcept { return entries_.size(); }

    /// Shared instance.
    static const MorseTable& standard();

private:
    std::vector<std::pair<char, const char*>> entries_;
    std::unordered_map<char, const char*>     forward_;

    /// Reverse lookup: Morse pattern (e.g. ".-") -> character.
    std::unordered_map<std::string, char>     reverse_;
};

/// Codec settings.
struct CodecConfig {
    char unrecognized_sentinel = '?';   // emitted for a token with no match
};

/// Conversions between text, Morse strings and classified symbol streams.
///
/// Morse strings use '.' and '-', one space between characters and three
/// spaces between words. Text output is upper case.
class MorseCodec {
public:
    explicit MorseCodec(const CodecConfig& cfg = {});

    /// Encode text. Characters without a pattern are skipped; runs of
    /// whitespace become a single word gap.
    std::string text_to_morse(std::string_view text) const;

    /// Decode a Morse string. Patterns with no match are dropped, so the
    /// result can be shorter than the input (lossy on purpose).
    std::string morse_to_text(std::string_view morse) const;

    /// Group Dot/Dash runs into one token per character.
    static std::vector<MorseToken> symbols_to_tokens(
        const std::vector<MorseSymbol>& symbols);

    /// Translate tokens to text. An unknown pattern yields the sentinel
    /// character and decoding carries on with the next token.
    std::string tokens_to_text(const std::vector<MorseToken>& tokens) const;

    /// Number of tokens in `tokens` with no table match.
    std::size_t count_unrecognized(const std::vector<MorseToken>& tokens) const;

    char sentinel() const noexcept { return cfg_.unrecognized_sentinel; }

private:
    CodecConfig       cfg_;
    const MorseTable& table_;
};

} // namespace rune::device

#endif // RUNE_DEVICE_MORSE_CODEC_HPP
