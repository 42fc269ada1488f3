#include "mdlive/preview/document.hpp"

#include <algorithm>
#include <atomic>
#include <stdexcept>

namespace mdlive::preview
{
namespace
{
std::uint64_t nextSnapshotId() noexcept
{
    static std::atomic<std::uint64_t> counter{0};
    return ++counter;
}

} // namespace

std::shared_ptr<const DocumentSnapshot> DocumentSnapshot::create(std::string text)
{
    return std::shared_ptr<const DocumentSnapshot>(new DocumentSnapshot(std::move(text), nextSnapshotId()));
}

DocumentSnapshot::DocumentSnapshot(std::string text, std::uint64_t id)
    : content(std::move(text)), identity(id)
{
    splitLines();
}

void DocumentSnapshot::splitLines()
{
    std::size_t offset = 0;
    int number = 1;
    while (true)
    {
        std::size_t end = content.find('\n', offset);
        std::size_t lineEnd = end == std::string::npos ? content.size() : end;
        std::size_t textEnd = lineEnd;
        if (textEnd > offset && content[textEnd - 1] == '\r')
            --textEnd;

        DocumentLine line;
        line.number = number++;
        line.from = offset;
        line.to = textEnd;
        line.text = std::string_view(content).substr(offset, textEnd - offset);
        lineTable.push_back(line);

        if (end == std::string::npos)
            break;
        offset = end + 1;
    }
}

const DocumentLine &DocumentSnapshot::line(int number) const
{
    if (number < 1 || number > lineCount())
        throw std::out_of_range("line number " + std::to_string(number) + " outside document");
    return lineTable[static_cast<std::size_t>(number - 1)];
}

const DocumentLine &DocumentSnapshot::lineAt(std::size_t offset) const
{
    offset = std::min(offset, content.size());
    auto it = std::upper_bound(lineTable.begin(), lineTable.end(), offset,
                               [](std::size_t value, const DocumentLine &line) { return value < line.from; });
    if (it == lineTable.begin())
        return lineTable.front();
    return *(it - 1);
}

std::string_view DocumentSnapshot::slice(std::size_t from, std::size_t to) const noexcept
{
    from = std::min(from, content.size());
    to = std::clamp(to, from, content.size());
    return std::string_view(content).substr(from, to - from);
}

} // namespace mdlive::preview
