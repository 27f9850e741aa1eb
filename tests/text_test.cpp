// Unit tests for brvalid/text.hpp
// Tests: Accent folding, title casing

#include <gtest/gtest.h>

#include <brvalid/text.hpp>

#include <string>

namespace brvalid {
namespace {

class RemoveAccentsTest : public ::testing::Test {};

TEST_F(RemoveAccentsTest, PortugueseNames) {
  EXPECT_EQ(RemoveAccents("São Paulo"), "Sao Paulo");
  EXPECT_EQ(RemoveAccents("João Conceição"), "Joao Conceicao");
  EXPECT_EQ(RemoveAccents("AÇÃO"), "ACAO");
  EXPECT_EQ(RemoveAccents("Florianópolis"), "Florianopolis");
  EXPECT_EQ(RemoveAccents("Goiânia"), "Goiania");
}

TEST_F(RemoveAccentsTest, AllVowelAccents) {
  EXPECT_EQ(RemoveAccents("àáâãä èéêë ìíîï òóôõö ùúûü"), "aaaaa eeee iiii ooooo uuuu");
  EXPECT_EQ(RemoveAccents("ÀÁÂÃÄ ÈÉÊË ÌÍÎÏ ÒÓÔÕÖ ÙÚÛÜ"), "AAAAA EEEE IIII OOOOO UUUU");
  EXPECT_EQ(RemoveAccents("Ñandú"), "Nandu");
}

TEST_F(RemoveAccentsTest, OtherCharactersUnchanged) {
  EXPECT_EQ(RemoveAccents(""), "");
  EXPECT_EQ(RemoveAccents("plain ascii 123-./"), "plain ascii 123-./");
  EXPECT_EQ(RemoveAccents("Æsir ø ß"), "Æsir ø ß");
  EXPECT_EQ(RemoveAccents("Москва"), "Москва");
  EXPECT_EQ(RemoveAccents("日本"), "日本");
}

TEST_F(RemoveAccentsTest, TruncatedSequencePassesThrough) {
  std::string truncated = "ab\xC3";
  EXPECT_EQ(RemoveAccents(truncated), truncated);
}

class TitleCaseTest : public ::testing::Test {};

TEST_F(TitleCaseTest, Basic) {
  EXPECT_EQ(TitleCase("maria da silva"), "Maria Da Silva");
  EXPECT_EQ(TitleCase("MARIA DA SILVA"), "Maria Da Silva");
  EXPECT_EQ(TitleCase("mArIa"), "Maria");
}

TEST_F(TitleCaseTest, AccentedLetters) {
  EXPECT_EQ(TitleCase("joão conceição"), "João Conceição");
  EXPECT_EQ(TitleCase("JOSÉ ÉLIO"), "José Élio");
  EXPECT_EQ(TitleCase("émile"), "Émile");
}

TEST_F(TitleCaseTest, CollapsesWhitespace) {
  EXPECT_EQ(TitleCase("  ana \t  paula\n"), "Ana Paula");
  EXPECT_EQ(TitleCase(""), "");
  EXPECT_EQ(TitleCase("   "), "");
}

TEST_F(TitleCaseTest, NonLetterFirstCharacter) {
  EXPECT_EQ(TitleCase("123abc"), "123abc");
  EXPECT_EQ(TitleCase("o'NEIL"), "O'neil");
}

}  // namespace
}  // namespace brvalid
