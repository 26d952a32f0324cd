#include <gtest/gtest.h>

#include <map>
#include <string>
#include <vector>

#include "docqa_core/chunking/paragraph_chunker.hpp"
#include "docqa_core/text/text_utils.hpp"

namespace docqa_tests {

using namespace docqa_core;

namespace {

std::vector<std::string> texts_of(const std::vector<Chunk>& chunks) {
  std::vector<std::string> texts;
  for (const auto& chunk : chunks) {
    texts.push_back(chunk.text());
  }
  return texts;
}

const std::vector<std::string> kParagraphs = {"Alpha text is here.", "Bravo text is here.",
                                              "Charlie text here.", "Delta text is here.",
                                              "Echo text is here!!"};

std::string join_paragraphs(const std::vector<std::string>& paragraphs) {
  std::string joined;
  for (const auto& paragraph : paragraphs) {
    if (!joined.empty()) {
      joined += "\n\n";
    }
    joined += paragraph;
  }
  return joined;
}

// Paragraphs broken into sentences: the smallest pieces the chunker keeps whole.
std::vector<std::string> atoms_of(const std::string& text) {
  std::vector<std::string> atoms;
  for (const auto& paragraph : split_paragraphs(text)) {
    for (auto& sentence : split_sentences(paragraph)) {
      atoms.push_back(std::move(sentence));
    }
  }
  return atoms;
}

std::vector<std::string> mixed_document_paragraphs() {
  std::vector<std::string> paragraphs = {
      "GETTING STARTED",
      "The tool reads plain files. It keeps every chunk small.",
      "Installation:",
      "Copy the binary somewhere on the path. Then run it once."};

  std::string oversized;
  for (int i = 1; i <= 8; ++i) {
    if (!oversized.empty()) {
      oversized += ' ';
    }
    oversized += "Long paragraph sentence " + std::to_string(i) + " adds some more words.";
  }
  paragraphs.push_back(oversized);

  paragraphs.push_back("REFERENCE");
  paragraphs.push_back("Options are read from a json file.");
  paragraphs.push_back("Every option has a default value!");
  paragraphs.push_back("Unknown keys are ignored? Yes they are.");
  return paragraphs;
}

}  // namespace

TEST(ParagraphChunkerTest, ShortDocumentBecomesOneChunk) {
  ParagraphChunker chunker(1000, 200);

  auto chunks = chunker.split("Title:\n\nParagraph A. Paragraph B.");

  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0].text(), "Title:\n\nParagraph A. Paragraph B.");
}

TEST(ParagraphChunkerTest, EmptyOrBlankTextGivesNoChunks) {
  ParagraphChunker chunker(1000, 200);

  EXPECT_TRUE(chunker.split("").empty());
  EXPECT_TRUE(chunker.split("  \n\n \t\n").empty());
}

TEST(ParagraphChunkerTest, CarriesLastTwoParagraphsIntoNextChunk) {
  ParagraphChunker chunker(70, 10);

  auto texts = texts_of(chunker.split(join_paragraphs(kParagraphs)));

  ASSERT_EQ(texts.size(), 3u);
  EXPECT_EQ(texts[0], join_paragraphs({kParagraphs[0], kParagraphs[1], kParagraphs[2]}));
  EXPECT_EQ(texts[1], join_paragraphs({kParagraphs[1], kParagraphs[2], kParagraphs[3]}));
  EXPECT_EQ(texts[2], join_paragraphs({kParagraphs[2], kParagraphs[3], kParagraphs[4]}));
}

TEST(ParagraphChunkerTest, ZeroOverlapDisablesParagraphCarryOver) {
  ParagraphChunker chunker(70, 0);

  auto texts = texts_of(chunker.split(join_paragraphs(kParagraphs)));

  ASSERT_EQ(texts.size(), 2u);
  EXPECT_EQ(texts[0], join_paragraphs({kParagraphs[0], kParagraphs[1], kParagraphs[2]}));
  EXPECT_EQ(texts[1], join_paragraphs({kParagraphs[3], kParagraphs[4]}));
}

TEST(ParagraphChunkerTest, HeadingMovesToStartOfNextChunk) {
  ParagraphChunker chunker(1000, 200);

  auto texts = texts_of(chunker.split("Intro paragraph text.\n\nSECTION TWO\n\nBody text."));

  ASSERT_EQ(texts.size(), 2u);
  EXPECT_EQ(texts[0], "Intro paragraph text.");
  EXPECT_EQ(texts[1], "SECTION TWO\n\nBody text.");
}

TEST(ParagraphChunkerTest, OversizedParagraphIsResplitBySentence) {
  ParagraphChunker chunker(50, 10);
  std::string paragraph;
  for (int i = 1; i <= 10; ++i) {
    if (!paragraph.empty()) {
      paragraph += ' ';
    }
    paragraph += "Sentence " + std::to_string(i) + " is short.";
  }

  auto texts = texts_of(chunker.split(paragraph));

  ASSERT_EQ(texts.size(), 5u);
  EXPECT_EQ(texts[0], "Sentence 1 is short. Sentence 2 is short.");
  EXPECT_EQ(texts[4], "Sentence 9 is short. Sentence 10 is short.");
}

TEST(ParagraphChunkerTest, NoChunkExceedsChunkSize) {
  ParagraphChunker chunker(100, 20);
  std::vector<std::string> paragraphs;
  for (int i = 0; i < 12; ++i) {
    paragraphs.push_back("Paragraph " + std::to_string(i) + " carries a few plain words.");
  }

  auto chunks = chunker.split(join_paragraphs(paragraphs));

  ASSERT_FALSE(chunks.empty());
  for (const auto& chunk : chunks) {
    EXPECT_LE(chunk.length(), 100u) << chunk.text();
    EXPECT_EQ(chunk.length(), char_count(chunk.text()));
  }
}

TEST(ParagraphChunkerTest, SingleSentenceLongerThanChunkSizeIsKeptWhole) {
  ParagraphChunker chunker(20, 5);
  const std::string sentence = "This single sentence is clearly longer than twenty characters";

  auto chunks = chunker.split(sentence);

  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0].text(), sentence);
  EXPECT_GT(chunks[0].length(), 20u);
}

TEST(ParagraphChunkerTest, ChunksComeOutWithoutDocument) {
  ParagraphChunker chunker(1000, 200);

  auto chunks = chunker.split("Some text.");

  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_TRUE(chunks[0].document().document_path.empty());
}

TEST(ParagraphChunkerTest, ChunksCoverEveryParagraphInOrder) {
  const auto paragraphs = mixed_document_paragraphs();
  const std::string document = join_paragraphs(paragraphs);
  const auto document_atoms = atoms_of(document);
  std::map<std::string, size_t> atom_index;
  for (size_t i = 0; i < document_atoms.size(); ++i) {
    ASSERT_TRUE(atom_index.emplace(document_atoms[i], i).second) << document_atoms[i];
  }

  const std::vector<std::pair<size_t, size_t>> settings = {
      {60, 0}, {80, 20}, {150, 30}, {300, 50}, {1000, 200}};
  for (const auto& [size, overlap] : settings) {
    SCOPED_TRACE("chunk_size=" + std::to_string(size) + " overlap=" + std::to_string(overlap));
    ParagraphChunker chunker(size, overlap);

    auto texts = texts_of(chunker.split(document));
    ASSERT_FALSE(texts.empty());

    // Whole paragraph in some chunk, or each of its sentences is.
    for (const auto& paragraph : paragraphs) {
      bool whole = false;
      for (const auto& text : texts) {
        whole = whole || text.find(paragraph) != std::string::npos;
      }
      if (whole) {
        continue;
      }
      for (const auto& sentence : split_sentences(paragraph)) {
        bool found = false;
        for (const auto& text : texts) {
          found = found || text.find(sentence) != std::string::npos;
        }
        EXPECT_TRUE(found) << "missing: " << sentence;
      }
    }

    std::vector<size_t> first_seen;
    std::vector<bool> seen(document_atoms.size(), false);
    for (const auto& text : texts) {
      const auto chunk_atoms = atoms_of(text);
      ASSERT_FALSE(chunk_atoms.empty());
      auto first = atom_index.find(chunk_atoms.front());
      ASSERT_NE(first, atom_index.end()) << "unknown text: " << chunk_atoms.front();

      // A chunk is a run of consecutive document pieces.
      for (size_t k = 0; k < chunk_atoms.size(); ++k) {
        ASSERT_LT(first->second + k, document_atoms.size()) << text;
        ASSERT_EQ(chunk_atoms[k], document_atoms[first->second + k]) << text;
        if (!seen[first->second + k]) {
          seen[first->second + k] = true;
          first_seen.push_back(first->second + k);
        }
      }
    }

    ASSERT_EQ(first_seen.size(), document_atoms.size());
    for (size_t i = 0; i < first_seen.size(); ++i) {
      EXPECT_EQ(first_seen[i], i);
    }
  }
}

TEST(ParagraphChunkerTest, RecognizesHeadings) {
  EXPECT_TRUE(ParagraphChunker::is_heading("Installation:"));
  EXPECT_TRUE(ParagraphChunker::is_heading("CHAPTER 1"));
  EXPECT_FALSE(ParagraphChunker::is_heading("Chapter 1"));
  EXPECT_FALSE(ParagraphChunker::is_heading("1234"));
  EXPECT_FALSE(ParagraphChunker::is_heading(std::string(120, 'A')));
}

TEST(ParagraphChunkerTest, HeadingCaseIsJudgedOnAsciiLetters) {
  EXPECT_TRUE(ParagraphChunker::is_heading("ÉTÉ"));
  EXPECT_TRUE(ParagraphChunker::is_heading("ÜBER ALLES"));
  EXPECT_FALSE(ParagraphChunker::is_heading("À"));
  EXPECT_FALSE(ParagraphChunker::is_heading("Über alles"));
}

}  // namespace docqa_tests
