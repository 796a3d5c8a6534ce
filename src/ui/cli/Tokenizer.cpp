#include "Tokenizer.hpp"

#include "securebox/security/MemoryWiper.hpp"
#include <cctype>
#include <utility>

namespace securebox::ui::cli
{

std::optional<std::vector<std::string>> Tokenizer::tokenize(std::string_view line)
{
    std::vector<std::string> words;
    std::string word;
    bool inWord{ false };
    Quote quote{ Quote::None };

    for (std::size_t i{ 0 }; i < line.size(); ++i)
    {
        i = consume(line, i, quote, word, inWord, words);
    }

    if (quote != Quote::None)
    {
        securebox::security::secureWipeString(word);
        securebox::security::secureWipeStrings(words);
        return std::nullopt;
    }

    endWord(word, inWord, words);
    securebox::security::secureWipeString(word);
    return words;
}

std::size_t Tokenizer::consume(std::string_view line, std::size_t i, Quote& quote, std::string& word, bool& inWord,
                               std::vector<std::string>& words)
{
    const char c{ line[i] };
    const bool hasNext{ i + 1 < line.size() };

    switch (quote)
    {
    case Quote::Single:
        if (c == '\'')
        {
            quote = Quote::None;
        }
        else
        {
            word.push_back(c);
        }
        return i;

    case Quote::Double:
        if (c == '"')
        {
            quote = Quote::None;
            return i;
        }
        if (c == '\\' && hasNext && (line[i + 1] == '"' || line[i + 1] == '\\'))
        {
            word.push_back(line[i + 1]);
            return i + 1;
        }
        word.push_back(c);
        return i;

    case Quote::None:
        break;
    }

    if (std::isspace(static_cast<unsigned char>(c)) != 0)
    {
        endWord(word, inWord, words);
        return i;
    }

    // Quotes start a word even when nothing follows, so '' yields an empty argument.
    inWord = true;
    if (c == '\'')
    {
        quote = Quote::Single;
        return i;
    }
    if (c == '"')
    {
        quote = Quote::Double;
        return i;
    }
    if (c == '\\' && hasNext)
    {
        word.push_back(line[i + 1]);
        return i + 1;
    }
    word.push_back(c);
    return i;
}

void Tokenizer::endWord(std::string& word, bool& inWord, std::vector<std::string>& words)
{
    if (inWord)
    {
        words.push_back(std::move(word));
    }
    word.clear();
    inWord = false;
}

} // namespace securebox::ui::cli
