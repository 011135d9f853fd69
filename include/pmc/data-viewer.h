#pragma once

#include <pmc/layout.h>
#include <pmc/record.h>
#include <pmc/result.hpp>
#include <pmc/screen-buffer.h>
#include <pmc/store.h>
#include <pmc/theme.h>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace pmc {

// Error::code() for a bad column configuration
constexpr int VIEWER_CONFIG_ERROR = 200;

struct ColumnSpec {
    std::string name;   // field name; "id" shows the record id
    std::string label;
    int width = 0;
};

using SchemaProvider = std::function<std::vector<ColumnSpec>(const std::string& kind)>;

enum class SortDirection {
    Ascending,
    Descending
};

// Case-insensitive substring match on the formatted field value
struct FieldFilter {
    std::string field;
    std::string text;
};

struct ColumnLayout {
    std::vector<int> offsets;  // relative to the content region
    std::vector<int> widths;
    int contentWidth = 0;      // sum of widths plus one separator per column
};

// In-progress cell edit drawn over the selected cell
struct EditOverlay {
    std::string text;
    size_t cursor = 0;  // in code points
};

// Cut to width code points, last one replaced by an ellipsis when cut
std::string truncateText(std::string_view text, int width);

//=============================================================================
// DataViewer - filtered/sorted projection of one store collection
//
// The projection is rebuilt from the snapshot on every change, never patched.
// selectedRow stays in [0, filteredCount-1] (0 when empty) and inside the
// viewport.
//=============================================================================

class DataViewer {
public:
    DataViewer(Store& store, std::string kind, SchemaProvider provider);

    const std::string& kind() const { return _kind; }

    //-------------------------------------------------------------------------
    // Columns
    //-------------------------------------------------------------------------

    Result<std::vector<ColumnSpec>> columns() const;

    // Strict: columns that do not fit are a configuration error
    Result<ColumnLayout> computeColumnLayout(int availableWidth) const;

    //-------------------------------------------------------------------------
    // Data
    //-------------------------------------------------------------------------

    // Refetch when the store digest moved (or when forced). Returns whether
    // the view was rebuilt.
    bool refresh(bool force = false);

    void setSort(const std::string& column, SortDirection direction);
    void clearSort();
    // Ascending, then descending, then back to ascending
    void toggleSort(const std::string& column);

    void addFilter(const std::string& field, const std::string& text);
    void clearFilters();

    const std::optional<std::string>& sortColumn() const { return _sortColumn; }
    SortDirection sortDirection() const { return _sortDirection; }
    const std::vector<FieldFilter>& filters() const { return _filters; }

    size_t filteredCount() const { return _view.size(); }
    const Record* item(size_t index) const;
    const Record* selectedRecord() const { return item(_selectedRow); }

    // "id" maps to the record id
    static FieldValue cellValue(const Record& record, const std::string& column);
    static std::string cellText(const Record& record, const std::string& column);

    //-------------------------------------------------------------------------
    // Cursor
    //-------------------------------------------------------------------------

    size_t selectedRow() const { return _selectedRow; }
    size_t scrollOffset() const { return _scrollOffset; }
    int viewportRows() const { return _viewportRows; }

    void setViewportRows(int rows);
    void moveSelection(int delta);
    void pageUp();
    void pageDown();
    void selectFirst();
    void selectLast();
    void selectRecord(const std::string& id);

    size_t selectedColumn() const { return _selectedColumn; }
    void moveColumn(int delta);

    //-------------------------------------------------------------------------
    // Output
    //-------------------------------------------------------------------------

    std::string queryDescription() const;

    // Screen rectangle of the selected cell, when it is visible
    std::optional<Region> selectedCellRect(const Region& content) const;

    Result<void> render(ScreenBuffer& buffer, const Region& content, const Region& status,
                        const Theme& theme, bool gridFocus,
                        const EditOverlay* edit = nullptr) const;

private:
    std::string selectedId() const;
    // Reorders the view; the record with keepId stays selected when present
    void rebuild(const std::string& keepId);
    void clampSelection();
    void ensureVisible();

    Store& _store;
    std::string _kind;
    SchemaProvider _provider;

    std::vector<Record> _snapshot;
    std::vector<size_t> _view;  // indices into _snapshot
    uint64_t _lastDigest = 0;
    bool _fetched = false;

    std::optional<std::string> _sortColumn;
    SortDirection _sortDirection = SortDirection::Ascending;
    std::vector<FieldFilter> _filters;

    size_t _selectedRow = 0;
    size_t _scrollOffset = 0;
    int _viewportRows = 0;
    size_t _selectedColumn = 0;
};

} // namespace pmc
