#include "gtest/gtest.h"
#include "../../src/Logic/BatchRenamerLogic.h"
#include <string>
#include <vector>

namespace
{
    NameTemplate MakeTemplate(const std::vector<TemplateToken> &tokens, const std::string &extension = ".pdf")
    {
        NameTemplate nameTemplate;
        nameTemplate.Tokens = tokens;
        nameTemplate.Extension = extension;
        return nameTemplate;
    }

    DataTable ReportTable()
    {
        DataTable table;
        table.Columns = {"Year", "Report", "FiscalYear"};
        table.Rows = {
            {CellValue::FromReal(2020.0), CellValue::FromText("Report"), CellValue::FromInteger(2021)},
            {CellValue::FromInteger(2022), CellValue::FromText("Q1/Q2"), CellValue::FromInteger(2023)}};
        return table;
    }
}

TEST(BatchRenamerLogicGenerate, NameTemplateText)
{
    NameTemplate nameTemplate = MakeTemplate({{TokenKind::Field, "Year"}, {TokenKind::Literal, "-"}, {TokenKind::Field, "Report"}});

    EXPECT_EQ(nameTemplate.ToString(), "Year-Report.pdf");
    std::vector<std::string> expected = {"Year", "Report"};
    EXPECT_EQ(nameTemplate.FieldNames(), expected);
    EXPECT_EQ(NameTemplate().ToString(), "");
}

TEST(BatchRenamerLogicGenerate, WholeRealsLoseTheirFraction)
{
    NameTemplate nameTemplate = MakeTemplate({{TokenKind::Field, "Year"}, {TokenKind::Literal, "-"}, {TokenKind::Field, "Report"}});

    GenerationResult results = BatchRenamerLogic::generateNames(ReportTable(), {"Year", "Report"}, nameTemplate);

    ASSERT_TRUE(results.success) << results.errorMessage;
    ASSERT_EQ(results.names.size(), 2u);
    EXPECT_EQ(results.names[0], "2020-Report");
    EXPECT_EQ(results.names[1], "2022-Q1_Q2");
}

TEST(BatchRenamerLogicGenerate, FieldNamesAreMatchedWhole)
{
    NameTemplate nameTemplate = MakeTemplate({{TokenKind::Field, "FiscalYear"}, {TokenKind::Literal, "_"}, {TokenKind::Field, "Year"}});

    GenerationResult results = BatchRenamerLogic::generateNames(ReportTable(), {"Year", "FiscalYear"}, nameTemplate);

    ASSERT_TRUE(results.success) << results.errorMessage;
    EXPECT_EQ(results.names[0], "2021_2020");
    EXPECT_EQ(results.names[1], "2023_2022");
}

TEST(BatchRenamerLogicGenerate, AdjacentFieldsWithoutSeparator)
{
    NameTemplate nameTemplate = MakeTemplate({{TokenKind::Field, "Report"}, {TokenKind::Field, "Year"}});

    GenerationResult results = BatchRenamerLogic::generateNames(ReportTable(), {"Report", "Year"}, nameTemplate);

    ASSERT_TRUE(results.success) << results.errorMessage;
    EXPECT_EQ(results.names[0], "Report2020");
}

TEST(BatchRenamerLogicGenerate, MissingColumnsAllReported)
{
    NameTemplate nameTemplate = MakeTemplate({{TokenKind::Field, "Year"}, {TokenKind::Literal, "-"}, {TokenKind::Field, "Region"}});

    GenerationResult results = BatchRenamerLogic::generateNames(ReportTable(), {"Year", "Dept"}, nameTemplate);

    EXPECT_FALSE(results.success);
    EXPECT_EQ(results.errorKind, BatchErrorKind::MissingColumn);
    std::vector<std::string> expected = {"Dept", "Region"};
    EXPECT_EQ(results.missingColumns, expected);
    EXPECT_TRUE(results.names.empty());
}

TEST(BatchRenamerLogicGenerate, InvalidSeparatorCharacters)
{
    NameTemplate nameTemplate = MakeTemplate({{TokenKind::Field, "Year"}, {TokenKind::Literal, "/./"}, {TokenKind::Field, "Report"}});

    ValidationResult validation = BatchRenamerLogic::validateTemplate(nameTemplate);
    EXPECT_FALSE(validation.success);
    EXPECT_EQ(validation.errorKind, BatchErrorKind::InvalidCharacters);
    EXPECT_EQ(validation.invalidCharacters, "/.");

    GenerationResult results = BatchRenamerLogic::generateNames(ReportTable(), {"Year", "Report"}, nameTemplate);
    EXPECT_FALSE(results.success);
    EXPECT_EQ(results.errorKind, BatchErrorKind::InvalidCharacters);
}

TEST(BatchRenamerLogicGenerate, EmptyTemplateRejected)
{
    ValidationResult validation = BatchRenamerLogic::validateTemplate(NameTemplate());

    EXPECT_FALSE(validation.success);
    EXPECT_EQ(validation.errorKind, BatchErrorKind::InvalidState);
}

TEST(BatchRenamerLogicGenerate, EmptyCellsProduceEmptyComponents)
{
    DataTable table;
    table.Columns = {"Name", "Code"};
    table.Rows = {{CellValue(), CellValue::FromText("A1")}};
    NameTemplate nameTemplate = MakeTemplate({{TokenKind::Field, "Name"}, {TokenKind::Literal, "_"}, {TokenKind::Field, "Code"}});

    GenerationResult results = BatchRenamerLogic::generateNames(table, {"Name", "Code"}, nameTemplate);

    ASSERT_TRUE(results.success) << results.errorMessage;
    EXPECT_EQ(results.names[0], "_A1");
}
