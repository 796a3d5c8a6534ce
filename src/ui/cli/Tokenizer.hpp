#ifndef SECUREBOX_UI_CLI_TOKENIZER_HPP
#define SECUREBOX_UI_CLI_TOKENIZER_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace securebox::ui::cli
{

// Splits a shell line into words. Single quotes are literal, double quotes allow \" and \\ escapes,
// a bare backslash escapes the next character. Returns nullopt for an unterminated quote.
// Lines may carry container text, so the scratch buffer is wiped before returning.
class Tokenizer final
{
public:
    [[nodiscard]] static std::optional<std::vector<std::string>> tokenize(std::string_view line);

private:
    enum class Quote
    {
        None,
        Single,
        Double
    };

    // Index of the last character consumed.
    [[nodiscard]] static std::size_t consume(std::string_view line, std::size_t i, Quote& quote, std::string& word,
                                             bool& inWord, std::vector<std::string>& words);
    static void endWord(std::string& word, bool& inWord, std::vector<std::string>& words);
};

} // namespace securebox::ui::cli

#endif // SECUREBOX_UI_CLI_TOKENIZER_HPP
