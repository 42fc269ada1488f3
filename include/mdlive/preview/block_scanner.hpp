#pragma once

#include "mdlive/preview/document.hpp"
#include "mdlive/preview/element.hpp"
#include "mdlive/preview/reference_table.hpp"

#include <cstddef>
#include <span>
#include <string>
#include <vector>

namespace mdlive::preview
{

// Line numbers (1-based) claimed by block constructs.
class LineSet
{
public:
    LineSet() = default;
    explicit LineSet(int lineCount);

    void insert(int line);
    void insertRange(int first, int last);
    void merge(const LineSet &other);
    bool contains(int line) const noexcept;
    bool intersects(int first, int last) const noexcept;
    std::size_t count() const noexcept;

private:
    std::vector<bool> bits;
};

struct BlockRange
{
    std::size_t from = 0;
    std::size_t to = 0;
    int startLine = 0;
    int endLine = 0;
};

struct CodeBlockMatch : BlockRange
{
    std::string language;
    std::string code;
    std::string fence;
};

struct MathBlockMatch : BlockRange
{
    std::string latex;
    MathDelimiter delimiter = MathDelimiter::DoubleDollar;
    std::string environment;
};

struct TableMatch : BlockRange
{
    std::vector<std::vector<std::string>> rows;
    std::vector<TableAlignment> alignments;
    bool hasHeader = true;
};

struct CalloutMatch : BlockRange
{
    std::string type;
    std::string title;
    std::string body;
    CalloutFold fold = CalloutFold::None;
};

struct DetailsMatch : BlockRange
{
    std::string summary;
    std::string body;
    bool open = false;
};

struct FootnoteDefinitionMatch : BlockRange
{
    std::string identifier;
    std::string body;
};

struct ReferenceDefinitionMatch : BlockRange
{
    std::string label;
    std::string url;
    std::string title;
};

using LineSpan = std::span<const DocumentLine>;

std::vector<CodeBlockMatch> scanCodeBlocks(LineSpan lines, std::size_t documentLength);
std::vector<MathBlockMatch> scanMathBlocks(LineSpan lines, std::size_t documentLength, const LineSet &excluded);
std::vector<TableMatch> scanTables(LineSpan lines, std::size_t documentLength, const LineSet &excluded);
std::vector<CalloutMatch> scanCallouts(LineSpan lines, std::size_t documentLength, const LineSet &excluded);
std::vector<DetailsMatch> scanDetails(LineSpan lines, std::size_t documentLength, const LineSet &excluded);
std::vector<FootnoteDefinitionMatch> scanFootnoteDefinitions(LineSpan lines, std::size_t documentLength,
                                                             const LineSet &excluded);
std::vector<ReferenceDefinitionMatch> scanReferenceDefinitions(LineSpan lines, std::size_t documentLength,
                                                               const LineSet &excluded);

// Splits a pipe-delimited row into trimmed cells; escaped pipes stay in the cell.
std::vector<std::string> splitTableRow(std::string_view row);
bool isTableSeparatorRow(std::string_view row);
std::vector<TableAlignment> parseAlignmentRow(std::string_view row);

struct BlockScanResult
{
    std::vector<CodeBlockMatch> codeBlocks;
    std::vector<MathBlockMatch> mathBlocks;
    std::vector<TableMatch> tables;
    std::vector<CalloutMatch> callouts;
    std::vector<DetailsMatch> details;
    std::vector<FootnoteDefinitionMatch> footnotes;
    std::vector<ReferenceDefinitionMatch> referenceDefinitions;

    ReferenceTable references;
    LineSet occupied;

    // Block records lifted into elements, ordered by start offset.
    std::vector<Element> toElements() const;
};

class BlockScanner
{
public:
    BlockScanResult scan(const DocumentSnapshot &snapshot) const;
};

} // namespace mdlive::preview
