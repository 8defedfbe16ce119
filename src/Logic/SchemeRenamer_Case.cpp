#include "SchemeRenamer.h"

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

namespace // Anonymous namespace for internal linkage helper functions
{
// ASCII only; <cctype> would follow whatever locale the host process set
constexpr std::string_view AsciiWhitespace = " \t\n\v\f\r";

inline char lower_ascii(char c) noexcept
{
	return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

inline char upper_ascii(char c) noexcept
{
	return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c;
}

// Word boundaries for title casing: whitespace, hyphen and underscore
inline bool is_word_separator(char c) noexcept
{
	return AsciiWhitespace.find(c) != std::string_view::npos || c == '-' || c == '_';
}

std::string to_lower_ascii(std::string s)
{
	std::transform(s.begin(), s.end(), s.begin(), lower_ascii);
	return s;
}

std::string to_upper_ascii(std::string s)
{
	std::transform(s.begin(), s.end(), s.begin(), upper_ascii);
	return s;
}

// First character upper-cased, the remainder lower-cased
std::string capitalize(const std::string &word)
{
	if (word.empty())
	{
		return word;
	}
	std::string out = to_lower_ascii(word);
	out[0] = upper_ascii(out[0]);
	return out;
}

// Splits 'text' into alternating word and separator tokens, starting and ending with a word
// (possibly empty), so even indices are words and odd indices are separator runs
std::vector<std::string> split_words(const std::string &text)
{
	std::vector<std::string> tokens;
	std::string current;
	bool inSeparator = false;
	for (char c : text)
	{
		const bool sep = is_word_separator(c);
		if (sep != inSeparator)
		{
			tokens.push_back(current);
			current.clear();
			inSeparator = sep;
		}
		current.push_back(c);
	}
	tokens.push_back(current);
	if (inSeparator)
	{
		tokens.emplace_back(); // Trailing separator run is followed by an empty word
	}
	return tokens;
}
} // namespace

// Title-cases 'text' word by word, keeping separators verbatim and small function words
// lower-case unless they are the first or last token
std::string SchemeRenamer::ImprovedTitleCase(const std::string &text)
{
	if (text.empty())
	{
		return text;
	}

	const std::vector<std::string> tokens = split_words(text);
	std::string result;
	result.reserve(text.size());

	for (std::size_t i = 0; i < tokens.size(); ++i)
	{
		const std::string &token = tokens[i];
		if (i % 2 == 1 || token.empty())
		{
			result += token; // Separator runs and empty words pass through
			continue;
		}

		const std::string lowered = to_lower_ascii(token);
		const bool isEdge = (i == 0 || i == tokens.size() - 1);
		const bool isSmallWord = std::find(TitleCaseSmallWords.begin(), TitleCaseSmallWords.end(), lowered) != TitleCaseSmallWords.end();
		if (!isEdge && isSmallWord)
		{
			result += lowered;
			continue;
		}

		// "o'connor" -> "O'Connor": both sides of the first apostrophe are capitalised
		const std::size_t apostrophe = token.find('\'');
		if (apostrophe != std::string::npos)
		{
			result += capitalize(token.substr(0, apostrophe));
			result += '\'';
			result += capitalize(token.substr(apostrophe + 1));
		}
		else
		{
			result += capitalize(token);
		}
	}
	return result;
}

// Applies 'option' to a filename stem; byte-wise ASCII folding, independent of the global locale
std::string SchemeRenamer::TransformCase(const std::string &stem, CaseOption option)
{
	switch (option)
	{
	case CaseOption::Lower:
		return to_lower_ascii(stem);
	case CaseOption::Upper:
		return to_upper_ascii(stem);
	case CaseOption::Title:
		return ImprovedTitleCase(stem);
	case CaseOption::Preserve:
	default:
		return stem;
	}
}
