#include "morse_codec.hpp"

#include <cctype>
#include <cstdio>

namespace rune::device {

// ---------------------------------------------------------------------------
// Table
// ---------------------------------------------------------------------------

MorseTable::MorseTable() {
    entries_ = {
        // Letters A-Z
        {'A', ".-"},    {'B', "-..."},  {'C', "-.-."},  {'D', "-.."},
        {'E', "."},     {'F', "..-."},  {'G', "--."},   {'H', "...."},
        {'I', ".."},    {'J', ".---"},  {'K', "-.-"},   {'L', ".-.."},
        {'M', "--"},    {'N', "-."},    {'O', "---"},   {'P', ".--."},
        {'Q', "--.-"},  {'R', ".-."},   {'S', "..."},   {'T', "-"},
        {'U', "..-"},   {'V', "...-"},  {'W', ".--"},   {'X', "-..-"},
        {'Y', "-.--"},  {'Z', "--.."},
        // Digits 0-9
        {'0', "-----"}, {'1', ".----"}, {'2', "..---"}, {'3', "...--"},
        {'4', "....-"}, {'5', "....."}, {'6', "-...."}, {'7', "--..."},
        {'8', "---.."}, {'9', "----."},
        // Punctuation
        {'.', ".-.-.-"},  {',', "--..--"},  {'?', "..--.."},  {'\'', ".----."},
        {'!', "-.-.--"},  {'/', "-..-."},   {'(', "-.--."},   {')', "-.--.-"},
        {'&', ".-..."},   {':', "---..."},  {';', "-.-.-."},  {'=', "-...-"},
        {'+', ".-.-."},   {'-', "-....-"},  {'_', "..--.-"},  {'"', ".-..-."},
        {'$', "...-..-"}, {'@', ".--.-."},
    };

    forward_.reserve(entries_.size());
    reverse_.reserve(entries_.size());
    for (const auto& [c, pattern] : entries_) {
        forward_[c] = pattern;
        if (!reverse_.emplace(pattern, c).second) {
            std::fprintf(stderr, "[codec] duplicate pattern %s for '%c'\n",
                         pattern, c);
        }
    }
}

const char* MorseTable::lookup(char c) const {
    auto upper = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    auto it = forward_.find(upper);
    return it != forward_.end() ? it->second : nullptr;
}

char MorseTable::reverse_lookup(std::string_view pattern) const {
    auto it = reverse_.find(std::string(pattern));
    return it != reverse_.end() ? it->second : '\0';
}

const MorseTable& MorseTable::standard() {
    static const MorseTable table;
    return table;
}

// ---------------------------------------------------------------------------
// Text <-> Morse string
// ---------------------------------------------------------------------------

MorseCodec::MorseCodec(const CodecConfig& cfg)
    : cfg_(cfg), table_(MorseTable::standard()) {}

std::string MorseCodec::text_to_morse(std::string_view text) const {
    std::string result;
    std::string word;

    auto flush_word = [&]() {
        if (word.empty()) return;
        if (!result.empty()) result += "   ";
        result += word;
        word.clear();
    };

    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            flush_word();
            continue;
        }
        const char* pattern = table_.lookup(c);
        if (!pattern) continue;   // no pattern: skip the character
        if (!word.empty()) word += ' ';
        word += pattern;
    }
    flush_word();

    return result;
}

std::string MorseCodec::morse_to_text(std::string_view morse) const {
    std::string result;
    std::string pattern;
    bool pending_word_break = false;

    auto flush_char = [&]() {
        if (pattern.empty()) return;
        char c = table_.reverse_lookup(pattern);
        pattern.clear();
        if (c == '\0') return;   // unmapped patterns are dropped
        if (pending_word_break && !result.empty()) result += ' ';
        pending_word_break = false;
        result += c;
    };

    std::size_t i = 0;
    while (i < morse.size()) {
        char c = morse[i];
        if (c == ' ') {
            flush_char();
            std::size_t run = 0;
            while (i < morse.size() && morse[i] == ' ') { ++run; ++i; }
            // One space separates characters, three separate words.
            if (run >= 3) pending_word_break = true;
            continue;
        }
        if (c == '.' || c == '-') pattern += c;
        ++i;
    }
    flush_char();

    return result;
}

// ---------------------------------------------------------------------------
// Symbol stream -> tokens -> text
// ---------------------------------------------------------------------------

std::vector<MorseToken> MorseCodec::symbols_to_tokens(
    const std::vector<MorseSymbol>& symbols) {
    std::vector<MorseToken> tokens;
    std::string current;

    auto flush = [&](bool word_break) {
        if (!current.empty()) {
            tokens.push_back({current, word_break});
            current.clear();
        } else if (word_break && !tokens.empty()) {
            // Gap after a completed character widened into a word gap.
            tokens.back().ends_word = true;
        }
    };

    for (MorseSymbol s : symbols) {
        switch (s) {
            case MorseSymbol::Dot:          current += '.'; break;
            case MorseSymbol::Dash:         current += '-'; break;
            case MorseSymbol::IntraCharGap: break;
            case MorseSymbol::InterCharGap: flush(false); break;
            case MorseSymbol::InterWordGap: flush(true); break;
        }
    }
    flush(false);

    return tokens;
}

std::string MorseCodec::tokens_to_text(const std::vector<MorseToken>& tokens) const {
    std::string result;
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        char c = table_.reverse_lookup(tokens[i].pattern);
        result += (c != '\0') ? c : cfg_.unrecognized_sentinel;
        if (tokens[i].ends_word && i + 1 < tokens.size()) {
            result += ' ';
        }
    }
    return result;
}

std::size_t MorseCodec::count_unrecognized(const std::vector<MorseToken>& tokens) const {
    std::size_t count = 0;
    for (const auto& token : tokens) {
        if (table_.reverse_lookup(token.pattern) == '\0') ++count;
    }
    return count;
}

} // namespace rune::device
