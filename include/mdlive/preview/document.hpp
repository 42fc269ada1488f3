#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace mdlive::preview
{

struct DocumentLine
{
    int number = 0;
    std::size_t from = 0;
    std::size_t to = 0;
    std::string_view text;
};

// Immutable text of one document revision. Line text views point into the
// snapshot's own storage and stay valid for its lifetime.
class DocumentSnapshot
{
public:
    static std::shared_ptr<const DocumentSnapshot> create(std::string text);

    DocumentSnapshot(const DocumentSnapshot &) = delete;
    DocumentSnapshot &operator=(const DocumentSnapshot &) = delete;

    std::uint64_t id() const noexcept { return identity; }
    const std::string &text() const noexcept { return content; }
    std::size_t length() const noexcept { return content.size(); }
    int lineCount() const noexcept { return static_cast<int>(lineTable.size()); }
    const std::vector<DocumentLine> &lines() const noexcept { return lineTable; }

    // 1-based; throws std::out_of_range for numbers outside [1, lineCount()].
    const DocumentLine &line(int number) const;
    const DocumentLine &lineAt(std::size_t offset) const;

    std::string_view slice(std::size_t from, std::size_t to) const noexcept;

private:
    DocumentSnapshot(std::string text, std::uint64_t id);
    void splitLines();

    std::string content;
    std::uint64_t identity = 0;
    std::vector<DocumentLine> lineTable;
};

using SnapshotPtr = std::shared_ptr<const DocumentSnapshot>;

} // namespace mdlive::preview
