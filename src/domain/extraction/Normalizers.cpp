/**
 * @file Normalizers.cpp
 * @brief Implementation of the normalization strategies.
 */

#include "domain/extraction/Normalizers.hpp"

#include <array>
#include <cctype>
#include <cstdio>
#include <regex>

namespace lextable::domain::extraction {

namespace {

const std::array<const char*, 12> kMonthNames = {
    "jan", "feb", "mar", "apr", "may", "jun", "jul", "aug", "sep", "oct", "nov", "dec"};

const char* kMonthPattern =
    "(january|february|march|april|may|june|july|august|september|october|november|december|"
    "jan|feb|mar|apr|jun|jul|aug|sept|sep|oct|nov|dec)";

int MonthFromName(const std::string& name) {
    std::string lowered;
    for (unsigned char c : name) lowered.push_back(static_cast<char>(std::tolower(c)));
    for (std::size_t i = 0; i < kMonthNames.size(); ++i) {
        if (lowered.compare(0, 3, kMonthNames[i]) == 0) return static_cast<int>(i) + 1;
    }
    return 0;
}

bool IsLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

bool IsValidDate(int year, int month, int day) {
    static const std::array<int, 12> kDays = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (year < 1000 || year > 9999 || month < 1 || month > 12 || day < 1) return false;
    int maxDay = kDays[static_cast<std::size_t>(month - 1)];
    if (month == 2 && IsLeapYear(year)) maxDay = 29;
    return day <= maxDay;
}

std::string FormatIsoDate(int year, int month, int day) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", year, month, day);
    return buffer;
}

struct DateCandidate {
    std::ptrdiff_t position = -1;
    int year = 0;
    int month = 0;
    int day = 0;
};

// Keeps the earliest valid date found in the text.
void Consider(DateCandidate& best, std::ptrdiff_t position, int year, int month, int day) {
    if (!IsValidDate(year, month, day)) return;
    if (best.position < 0 || position < best.position) {
        best = DateCandidate{position, year, month, day};
    }
}

} // namespace

std::string CompactWhitespace(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    bool pendingSpace = false;
    for (unsigned char c : input) {
        if (std::isspace(c)) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) {
            out.push_back(' ');
            pendingSpace = false;
        }
        out.push_back(static_cast<char>(c));
    }
    return out;
}

std::string TruncateUtf8(const std::string& text, std::size_t maxBytes) {
    if (text.size() <= maxBytes) {
        return text;
    }
    std::size_t cut = maxBytes;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return text.substr(0, cut);
}

NormalizationResult TextNormalizer::operator()(const std::string& input) const {
    std::string cleaned = CompactWhitespace(input);
    if (cleaned.empty()) {
        return {std::nullopt, false, "text_empty"};
    }
    return {cleaned, true, "text_cleanup"};
}

NormalizationResult DateNormalizer::operator()(const std::string& input) const {
    static const std::regex iso("\\b(\\d{4})-(\\d{1,2})-(\\d{1,2})\\b");
    static const std::regex monthFirst(
        std::string("\\b") + kMonthPattern + "\\.?\\s+(\\d{1,2})(?:st|nd|rd|th)?,?\\s+(\\d{4})\\b",
        std::regex::ECMAScript | std::regex::icase);
    static const std::regex dayFirst(
        std::string("\\b(\\d{1,2})(?:st|nd|rd|th)?\\s+(?:day\\s+of\\s+)?") + kMonthPattern + "\\.?,?\\s+(\\d{4})\\b",
        std::regex::ECMAScript | std::regex::icase);
    static const std::regex numeric("\\b(\\d{1,2})/(\\d{1,2})/(\\d{2,4})\\b");

    const std::string text = CompactWhitespace(input);
    DateCandidate best;
    std::smatch m;

    if (std::regex_search(text, m, iso)) {
        Consider(best, m.position(0), std::stoi(m[1].str()), std::stoi(m[2].str()), std::stoi(m[3].str()));
    }
    if (std::regex_search(text, m, monthFirst)) {
        Consider(best, m.position(0), std::stoi(m[3].str()), MonthFromName(m[1].str()), std::stoi(m[2].str()));
    }
    if (std::regex_search(text, m, dayFirst)) {
        Consider(best, m.position(0), std::stoi(m[3].str()), MonthFromName(m[2].str()), std::stoi(m[1].str()));
    }
    if (std::regex_search(text, m, numeric)) {
        // Month first, US convention.
        int year = std::stoi(m[3].str());
        if (m[3].length() == 2) year += year < 70 ? 2000 : 1900;
        Consider(best, m.position(0), year, std::stoi(m[1].str()), std::stoi(m[2].str()));
    }

    if (best.position < 0) {
        return {std::nullopt, false, "date_parse_failed"};
    }
    return {FormatIsoDate(best.year, best.month, best.day), true, "date_parsed"};
}

NormalizationResult CurrencyNormalizer::operator()(const std::string& input) const {
    static const std::regex amount(
        "(\\$|€|£)?\\s*((?:[0-9]{1,3}(?:,[0-9]{3})+|[0-9]+)(?:\\.[0-9]+)?)");
    static const std::regex code("\\b(USD|EUR|GBP)\\b", std::regex::ECMAScript | std::regex::icase);

    std::smatch m;
    if (!std::regex_search(input, m, amount)) {
        return {std::nullopt, false, "currency_parse_failed"};
    }

    std::string digits;
    for (char c : m[2].str()) {
        if (c != ',') digits.push_back(c);
    }

    std::string symbol = m[1].str();
    if (symbol.empty()) {
        std::smatch codeMatch;
        if (std::regex_search(input, codeMatch, code)) {
            std::string iso = codeMatch[1].str();
            for (auto& c : iso) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            return {iso + " " + digits, true, "currency_parsed"};
        }
    }
    return {symbol + digits, true, "currency_parsed"};
}

Normalizer MakeNormalizer(NormalizerId id) {
    switch (id) {
        case NormalizerId::Date: return DateNormalizer{};
        case NormalizerId::Currency: return CurrencyNormalizer{};
        case NormalizerId::Text: return TextNormalizer{};
    }
    return TextNormalizer{};
}

NormalizationResult Normalize(const Normalizer& normalizer, const std::string& input) {
    return std::visit([&input](const auto& strategy) { return strategy(input); }, normalizer);
}

} // namespace lextable::domain::extraction
