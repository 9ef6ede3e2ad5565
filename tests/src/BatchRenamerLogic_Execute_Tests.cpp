#include "TestFixtures.h"
#include "../../src/Logic/BatchRenamerLogic.h"
#include <vector>
#include <string>

namespace fs = std::filesystem;

TEST_F(BatchRenamerFilesystemTest, PerformRename_Successful)
{
    fs::path first = tempTestDir / "scan_001.pdf";
    fs::path second = tempTestDir / "scan_002.pdf";
    CreateDummyFile(first, "contentA");
    CreateDummyFile(second, "contentB");

    RenameExecutionResult results = BatchRenamerLogic::performRename({first, second}, {"Alpha", "Beta"});

    ASSERT_TRUE(results.overallSuccess) << results.errorMessage;
    ASSERT_EQ(results.successfulRenameOps.size(), 2u);
    EXPECT_EQ(results.successfulRenameOps[0].NewName, "Alpha.pdf");
    EXPECT_FALSE(fs::exists(first));
    EXPECT_FALSE(fs::exists(second));
    EXPECT_EQ(ReadFile(tempTestDir / "Alpha.pdf"), "contentA");
    EXPECT_EQ(ReadFile(tempTestDir / "Beta.pdf"), "contentB");
}

TEST_F(BatchRenamerFilesystemTest, PerformRename_LeadingBlankNameDropped)
{
    fs::path first = tempTestDir / "a.pdf";
    fs::path second = tempTestDir / "b.pdf";
    CreateDummyFile(first, "A");
    CreateDummyFile(second, "B");

    RenameExecutionResult results = BatchRenamerLogic::performRename({first, second}, {"", "Alpha", "Beta"});

    ASSERT_TRUE(results.overallSuccess) << results.errorMessage;
    EXPECT_EQ(ReadFile(tempTestDir / "Alpha.pdf"), "A");
    EXPECT_EQ(ReadFile(tempTestDir / "Beta.pdf"), "B");
}

TEST_F(BatchRenamerFilesystemTest, PerformRename_CountMismatchChangesNothing)
{
    std::vector<fs::path> files = {tempTestDir / "a.pdf", tempTestDir / "b.pdf", tempTestDir / "c.pdf"};
    for (const auto &file : files)
    {
        CreateDummyFile(file);
    }

    RenameExecutionResult results = BatchRenamerLogic::performRename(files, {"Alpha", "Beta"});

    EXPECT_FALSE(results.overallSuccess);
    EXPECT_EQ(results.errorKind, BatchErrorKind::CountMismatch);
    EXPECT_TRUE(results.successfulRenameOps.empty());
    for (const auto &file : files)
    {
        EXPECT_TRUE(fs::exists(file));
    }
}

TEST_F(BatchRenamerFilesystemTest, PerformRename_DuplicateTargetsCaughtBeforeRenaming)
{
    fs::path first = tempTestDir / "a.pdf";
    fs::path second = tempTestDir / "b.pdf";
    CreateDummyFile(first);
    CreateDummyFile(second);

    RenameExecutionResult results = BatchRenamerLogic::performRename({first, second}, {"Same", "Same"});

    EXPECT_FALSE(results.overallSuccess);
    EXPECT_EQ(results.errorKind, BatchErrorKind::RenameFailure);
    ASSERT_TRUE(results.failedIndex.has_value());
    EXPECT_EQ(*results.failedIndex, 1u);
    EXPECT_EQ(results.failedPath.string(), second.string());
    EXPECT_TRUE(results.successfulRenameOps.empty());
    EXPECT_TRUE(fs::exists(first));
    EXPECT_TRUE(fs::exists(second));
    EXPECT_FALSE(fs::exists(tempTestDir / "Same.pdf"));
}

TEST_F(BatchRenamerFilesystemTest, PerformRename_ExistingTargetNotOverwritten)
{
    fs::path first = tempTestDir / "a.pdf";
    fs::path second = tempTestDir / "b.pdf";
    fs::path taken = tempTestDir / "Taken.pdf";
    CreateDummyFile(first, "A");
    CreateDummyFile(second, "B");
    CreateDummyFile(taken, "keep me");

    RenameExecutionResult results = BatchRenamerLogic::performRename({first, second}, {"Fresh", "Taken"});

    EXPECT_FALSE(results.overallSuccess);
    ASSERT_TRUE(results.failedIndex.has_value());
    EXPECT_EQ(*results.failedIndex, 1u);
    EXPECT_EQ(ReadFile(taken), "keep me");
    EXPECT_TRUE(fs::exists(first));
    EXPECT_FALSE(fs::exists(tempTestDir / "Fresh.pdf"));
}

TEST_F(BatchRenamerFilesystemTest, PerformRename_EmptyNameInsideList)
{
    fs::path first = tempTestDir / "a.pdf";
    fs::path second = tempTestDir / "b.pdf";
    CreateDummyFile(first);
    CreateDummyFile(second);

    RenameExecutionResult results = BatchRenamerLogic::performRename({first, second}, {"Alpha", ""});

    EXPECT_FALSE(results.overallSuccess);
    ASSERT_TRUE(results.failedIndex.has_value());
    EXPECT_EQ(*results.failedIndex, 1u);
    EXPECT_TRUE(fs::exists(first));
}

TEST_F(BatchRenamerFilesystemTest, PerformRename_SourceMissingStopsAtThatFile)
{
    fs::path first = tempTestDir / "a.pdf";
    fs::path missing = tempTestDir / "gone.pdf";
    fs::path third = tempTestDir / "c.pdf";
    CreateDummyFile(first, "A");
    CreateDummyFile(third, "C");

    RenameExecutionResult results = BatchRenamerLogic::performRename({first, missing, third}, {"One", "Two", "Three"});

    EXPECT_FALSE(results.overallSuccess);
    EXPECT_EQ(results.errorKind, BatchErrorKind::RenameFailure);
    ASSERT_TRUE(results.failedIndex.has_value());
    EXPECT_EQ(*results.failedIndex, 1u);
    ASSERT_EQ(results.successfulRenameOps.size(), 1u);
    EXPECT_EQ(ReadFile(tempTestDir / "One.pdf"), "A");
    EXPECT_TRUE(fs::exists(third));
    EXPECT_FALSE(fs::exists(tempTestDir / "Three.pdf"));
}

TEST_F(BatchRenamerFilesystemTest, PerformRename_NameAlreadyCorrect)
{
    fs::path file = tempTestDir / "Alpha.pdf";
    CreateDummyFile(file, "A");

    RenameExecutionResult results = BatchRenamerLogic::performRename({file}, {"Alpha"});

    ASSERT_TRUE(results.overallSuccess) << results.errorMessage;
    EXPECT_EQ(results.successfulRenameOps.size(), 1u);
    EXPECT_EQ(ReadFile(file), "A");
}

TEST_F(BatchRenamerFilesystemTest, PerformRename_ReportsProgressAndStopsWhenTargetAppears)
{
    fs::path first = tempTestDir / "a.pdf";
    fs::path second = tempTestDir / "b.pdf";
    CreateDummyFile(first, "A");
    CreateDummyFile(second, "B");
    std::vector<std::size_t> seen;

    RenameExecutionResult results = BatchRenamerLogic::performRename({first, second}, {"Alpha", "Beta"},
        [&](const RenameOperation &op, std::size_t total) {
            EXPECT_EQ(total, 2u);
            seen.push_back(op.Index);
            CreateDummyFile(tempTestDir / "Beta.pdf", "late arrival");
        });

    EXPECT_FALSE(results.overallSuccess);
    EXPECT_EQ(results.errorKind, BatchErrorKind::RenameFailure);
    ASSERT_EQ(results.successfulRenameOps.size(), 1u);
    EXPECT_EQ(seen, std::vector<std::size_t>{0});
    EXPECT_EQ(ReadFile(tempTestDir / "Alpha.pdf"), "A");
    EXPECT_EQ(ReadFile(tempTestDir / "Beta.pdf"), "late arrival");
    EXPECT_TRUE(fs::exists(second));
}

TEST_F(BatchRenamerFilesystemTest, PerformRename_NonAsciiNamesStayUtf8)
{
    const std::string folderName = "R\xC3\xA9sum\xC3\xA9s";
    fs::path folder = tempTestDir / fs::u8path(folderName);
    fs::path first = folder / "a.pdf";
    fs::path second = folder / "b.pdf";
    CreateDummyFile(first, "A");
    CreateDummyFile(second, "B");
    CreateDummyFile(folder / "Beta.pdf", "taken");

    RenameExecutionResult results = BatchRenamerLogic::performRename({first, second}, {"M\xC3\xBCller", "Beta"});

    // The plan is rejected before anything moves; the message names the folder in UTF-8
    EXPECT_FALSE(results.overallSuccess);
    EXPECT_TRUE(results.successfulRenameOps.empty());
    EXPECT_NE(results.errorMessage.find(folderName), std::string::npos) << results.errorMessage;

    fs::remove(folder / "Beta.pdf");
    results = BatchRenamerLogic::performRename({first, second}, {"M\xC3\xBCller", "Beta"});

    ASSERT_TRUE(results.overallSuccess) << results.errorMessage;
    EXPECT_EQ(results.successfulRenameOps[0].NewName, "M\xC3\xBCller.pdf");
    EXPECT_EQ(ReadFile(folder / fs::u8path("M\xC3\xBCller.pdf")), "A");
}

TEST_F(BatchRenamerFilesystemTest, PerformRename_MappingIsLogged)
{
    fs::path first = tempTestDir / "a.pdf";
    fs::path second = tempTestDir / "b.pdf";
    CreateDummyFile(first, "A");
    CreateDummyFile(second, "B");
    LogCapture log;

    RenameExecutionResult results = BatchRenamerLogic::performRename({first, second}, {"Alpha", "Beta"});

    ASSERT_TRUE(results.overallSuccess) << results.errorMessage;
    EXPECT_TRUE(log.Contains(first.string() + " -> " + (tempTestDir / "Alpha.pdf").string()));
    EXPECT_TRUE(log.Contains((tempTestDir / "Beta.pdf").string()));
}
