#include "folio/cover/genre.hpp"
#include "folio/core/string.hpp"
#include <array>

namespace folio::cover {

namespace {

struct GenreKeywords {
    Genre genre;
    std::vector<std::string_view> prefixes;
};

const std::array<GenreKeywords, 5>& keyword_table() {
    static const std::array<GenreKeywords, 5> table = {{
        {Genre::Philosophical, {"philosoph", "courage", "wisdom", "mind", "soul", "meaning",
                                "truth", "happiness", "think", "stoic", "ethic"}},
        {Genre::Romantic,      {"love", "heart", "romance", "romantic", "kiss", "passion",
                                "bride", "desire", "wedding"}},
        {Genre::Technical,     {"python", "algorithm", "code", "coding", "programming", "data",
                                "software", "engineer", "computer", "machine", "system"}},
        {Genre::Mystery,       {"mystery", "mysteries", "dark", "secret", "shadow", "murder",
                                "ghost", "crime", "tower", "night"}},
        {Genre::Adventure,     {"journey", "wild", "adventure", "quest", "voyage",
                                "expedition", "island", "mountain", "explorer"}},
    }};
    return table;
}

bool word_matches(std::string_view word, std::string_view prefix) {
    return word.size() >= prefix.size() && word.substr(0, prefix.size()) == prefix;
}

} // anonymous namespace

std::string_view to_string(Genre genre) {
    switch (genre) {
        case Genre::Philosophical: return "philosophical";
        case Genre::Romantic:      return "romantic";
        case Genre::Technical:     return "technical";
        case Genre::Mystery:       return "mystery";
        case Genre::Adventure:     return "adventure";
    }
    return "unknown";
}

std::optional<Genre> detect_genre(std::string_view title) {
    auto words = split_whitespace(to_ascii_lowercase(title));

    for (const auto& entry : keyword_table()) {
        for (const auto& word : words) {
            for (auto prefix : entry.prefixes) {
                if (word_matches(word, prefix)) {
                    return entry.genre;
                }
            }
        }
    }
    return std::nullopt;
}

const std::vector<std::string_view>& genre_palette_names(Genre genre) {
    static const std::vector<std::string_view> philosophical = {"navy", "midnight", "charcoal"};
    static const std::vector<std::string_view> romantic = {"rose", "coral", "sunset"};
    static const std::vector<std::string_view> technical = {"steel", "ocean", "arctic"};
    static const std::vector<std::string_view> mystery = {"deep_plum", "lavender", "charcoal"};
    static const std::vector<std::string_view> adventure = {"timber", "terracotta", "desert", "forest"};

    switch (genre) {
        case Genre::Philosophical: return philosophical;
        case Genre::Romantic:      return romantic;
        case Genre::Technical:     return technical;
        case Genre::Mystery:       return mystery;
        case Genre::Adventure:     return adventure;
    }
    return philosophical;
}

} // namespace folio::cover
