#ifndef BATCHRENAMERLOGIC_H
#define BATCHRENAMERLOGIC_H

#include <vector>
#include <string>
#include <filesystem>
#include <optional>
#include <functional>
#include <cstddef>

namespace fs = std::filesystem;

// Failure categories reported by every logic operation
enum class BatchErrorKind
{
	None,
	NotFound,
	InvalidTarget,
	EmptySet,
	MixedExtensions,
	DisallowedExtension,
	UnsupportedFormat,
	ParseFailure,
	MissingColumn,
	InvalidCharacters,
	CountMismatch,
	RenameFailure,
	SplitFailure,
	InvalidState
};

struct FileEntry
{
	fs::path FullPath;
	std::string Extension; // Lower-cased, including the leading dot
	std::string SortKey;   // String the natural ordering is computed on
};

enum class CellKind
{
	Empty,
	Text,
	Integer,
	Real,
	Boolean
};

struct CellValue
{
	CellKind Kind = CellKind::Empty;
	std::string Text;
	long long Integer = 0;
	double Real = 0.0;
	bool Boolean = false;

	static CellValue FromText(const std::string &text);
	static CellValue FromInteger(long long value);
	static CellValue FromReal(double value);
	static CellValue FromBoolean(bool value);
};

// Row-oriented table; every row holds exactly one cell per column
struct DataTable
{
	std::vector<std::string> Columns;
	std::vector<std::vector<CellValue>> Rows;

	std::optional<std::size_t> ColumnIndex(const std::string &name) const;
	bool HasColumn(const std::string &name) const;
	const CellValue &Cell(std::size_t row, std::size_t column) const;
	bool Empty() const { return Columns.empty() || Rows.empty(); }
};

enum class TokenKind
{
	Field,
	Literal
};

struct TemplateToken
{
	TokenKind Kind;
	std::string Text;
};

// Naming template: ordered field references and literal separators plus the target extension
struct NameTemplate
{
	std::vector<TemplateToken> Tokens;
	std::string Extension;

	std::string ToString() const;
	std::vector<std::string> FieldNames() const;
	bool IsEmpty() const { return Tokens.empty(); }
};

struct DiscoveryResult
{
	std::vector<FileEntry> files;
	std::string extension;
	bool success = false;
	BatchErrorKind errorKind = BatchErrorKind::None;
	std::string errorMessage;
};

struct TableLoadResult
{
	DataTable table;
	bool success = false;
	BatchErrorKind errorKind = BatchErrorKind::None;
	std::string errorMessage;
};

struct ValidationResult
{
	bool success = false;
	BatchErrorKind errorKind = BatchErrorKind::None;
	std::string errorMessage;
	std::string invalidCharacters; // Each offending character listed once
};

struct GenerationResult
{
	std::vector<std::string> names;
	std::vector<std::string> missingColumns;
	bool success = false;
	BatchErrorKind errorKind = BatchErrorKind::None;
	std::string errorMessage;
};

struct RenameOperation
{
	std::string OldName;
	std::string NewName;
	fs::path OldFullPath;
	fs::path NewFullPath;
	std::size_t Index;
};

// Called after each completed operation with the size of the whole batch
using RenameProgressCallback = std::function<void(const RenameOperation &op, std::size_t total)>;

struct RenameExecutionResult
{
	std::vector<RenameOperation> successfulRenameOps;
	std::optional<std::size_t> failedIndex;
	fs::path failedPath;
	bool overallSuccess = false;
	BatchErrorKind errorKind = BatchErrorKind::None;
	std::string errorMessage;
};

std::string ToLower(std::string s);

class BatchRenamerLogic
{
private:
	static TableLoadResult loadWorkbook(const fs::path &workbookPath);
	static TableLoadResult loadDelimitedText(const fs::path &csvPath);

public:
	static bool iequals(const std::string &a, const std::string &b);
	static std::string Trim(const std::string &s);
	static std::string NormaliseExtension(const std::string &extension);
	static std::vector<std::string> ParseExtensionList(const std::string &commaSeparated);
	static std::string JoinList(const std::vector<std::string> &items, const std::string &separator);
	static bool NaturalLess(const std::string &a, const std::string &b);
	static CellValue ParseScalar(const std::string &text);
	static std::string FormatCellValue(const CellValue &value);
	static std::string SanitiseNameComponent(const std::string &value);
	static bool IsAllowedSeparatorChar(char c);
	static bool IsAllowedSeparatorText(const std::string &text);
	static std::string DescribeError(BatchErrorKind kind);

	static DiscoveryResult discoverFiles(const fs::path &directory, const std::vector<std::string> &allowedExtensions);
	static TableLoadResult loadTable(const fs::path &spreadsheetPath);
	static ValidationResult validateTemplate(const NameTemplate &nameTemplate);
	static GenerationResult generateNames(const DataTable &table, const std::vector<std::string> &selectedFields, const NameTemplate &nameTemplate);
	static RenameExecutionResult performRename(const std::vector<fs::path> &orderedFiles, std::vector<std::string> orderedNewNames,
												const RenameProgressCallback &onRenamed = nullptr);

	static const std::vector<std::string> DefaultAllowedExtensions;
	static const std::string SplittableExtension;
	static const std::string AllowedSeparatorPunctuation;
};

#endif // BATCHRENAMERLOGIC_H
