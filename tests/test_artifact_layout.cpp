#include <gtest/gtest.h>
#include "io/ArtifactLayout.h"
#include "io/FileWriter.h"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class ArtifactLayoutTest : public ::testing::Test {
protected:
    fs::path test_root;

    void SetUp() override {
        test_root = fs::absolute("tmp_layout_test");
        if (fs::exists(test_root)) fs::remove_all(test_root);
        fs::create_directories(test_root);
    }

    void TearDown() override {
        if (fs::exists(test_root)) fs::remove_all(test_root);
    }
};

TEST_F(ArtifactLayoutTest, SanitizesIllegalCharacters) {
    EXPECT_EQ(ArtifactLayout::sanitize("A/B\\C:D*E?F\"G<H>I|J"), "A_B_C_D_E_F_G_H_I_J");
    EXPECT_EQ(ArtifactLayout::sanitize("Plain name 101"), "Plain name 101");
}

TEST_F(ArtifactLayoutTest, FolderUsesStartYearAndName) {
    ArtifactLayout layout(test_root.string(), ".imscc");
    Entity e{ 5, "BIO101 Cells/Tissues", "2022-01-17T08:00:00Z" };

    EXPECT_EQ(fs::path(layout.folderFor(e)), test_root / "2022" / "BIO101 Cells_Tissues");

    Entity undated{ 6, "Loose", "" };
    EXPECT_EQ(fs::path(layout.folderFor(undated)), test_root / "unknown" / "Loose");
}

TEST_F(ArtifactLayoutTest, OnlyFinishedArtifactCounts) {
    ArtifactLayout layout(test_root.string(), ".imscc");
    Entity e{ 5, "BIO101", "2022-01-17T08:00:00Z" };

    EXPECT_FALSE(layout.hasArtifact(e));

    std::string dest;
    ASSERT_TRUE(layout.destinationFor(e, "bio.imscc", dest));
    EXPECT_TRUE(fs::is_directory(layout.folderFor(e)));
    EXPECT_FALSE(layout.hasArtifact(e));

    std::ofstream(dest + ".part") << "half";
    EXPECT_FALSE(layout.hasArtifact(e));

    std::ofstream(dest) << "whole";
    EXPECT_TRUE(layout.hasArtifact(e));
}

TEST_F(ArtifactLayoutTest, DestinationAlwaysCarriesSuffix) {
    ArtifactLayout layout(test_root.string(), ".imscc");
    Entity e{ 9, "CHEM", "2023-02-01" };

    std::string dest;
    ASSERT_TRUE(layout.destinationFor(e, "chem-export.zip", dest));
    EXPECT_EQ(fs::path(dest).filename().string(), "chem-export.zip.imscc");

    ASSERT_TRUE(layout.destinationFor(e, "", dest));
    EXPECT_EQ(fs::path(dest).filename().string(), "9.imscc");

    ASSERT_TRUE(layout.destinationFor(e, "a:b.imscc", dest));
    EXPECT_EQ(fs::path(dest).filename().string(), "a_b.imscc");
}

TEST_F(ArtifactLayoutTest, SizeOnDiskOfMissingFileIsZero) {
    EXPECT_EQ(FileWriter::sizeOnDisk((test_root / "absent").string()), 0u);

    FileWriter writer((test_root / "present").string());
    ASSERT_TRUE(writer.open(false));
    ASSERT_TRUE(writer.append("abcdef", 6));
    writer.close();
    EXPECT_EQ(FileWriter::sizeOnDisk((test_root / "present").string()), 6u);

    ASSERT_TRUE(writer.open(false));
    ASSERT_TRUE(writer.append("gh", 2));
    writer.close();
    EXPECT_EQ(FileWriter::sizeOnDisk((test_root / "present").string()), 8u);
}
