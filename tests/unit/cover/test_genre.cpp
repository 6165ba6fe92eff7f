#include <gtest/gtest.h>
#include "folio/cover/genre.hpp"
#include "folio/cover/palette.hpp"

using namespace folio;
using namespace folio::cover;

TEST(GenreTest, DetectsKeywords) {
    EXPECT_EQ(detect_genre("The Courage to be Disliked"), Genre::Philosophical);
    EXPECT_EQ(detect_genre("Love in the Time of Code"), Genre::Romantic);
    EXPECT_EQ(detect_genre("Python Algorithms Mastery"), Genre::Technical);
    EXPECT_EQ(detect_genre("The Mystery of the Dark Tower"), Genre::Mystery);
    EXPECT_EQ(detect_genre("Journey to the Wild"), Genre::Adventure);
}

TEST(GenreTest, CaseInsensitive) {
    EXPECT_EQ(detect_genre("PYTHON FOR EVERYONE"), Genre::Technical);
}

TEST(GenreTest, MatchesWordPrefixesOnly) {
    // "glove" contains "love" but does not start with it
    EXPECT_FALSE(detect_genre("A Glove Story").has_value());
    EXPECT_FALSE(detect_genre("").has_value());
    EXPECT_FALSE(detect_genre("Untitled").has_value());
}

TEST(GenreTest, PaletteNamesExist) {
    for (Genre genre : {Genre::Philosophical, Genre::Romantic, Genre::Technical,
                        Genre::Mystery, Genre::Adventure}) {
        const auto& names = genre_palette_names(genre);
        EXPECT_FALSE(names.empty()) << to_string(genre);
        for (auto name : names) {
            EXPECT_NE(find_palette(name), nullptr) << name;
        }
    }
}
