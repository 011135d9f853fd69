#include <pmc/data-viewer.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <cctype>

namespace pmc {

namespace {

constexpr char32_t SEPARATOR = U'│';
constexpr char32_t ELLIPSIS = U'…';

std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

void drawClipped(ScreenBuffer& buffer, int x, int y, int width, std::string_view text,
                 const CellStyle& style) {
    buffer.fill(x, y, width, 1, ScreenCell(U' ', style));
    buffer.setText(x, y, truncateText(text, width), style);
}

} // namespace

std::string truncateText(std::string_view text, int width) {
    if (width <= 0) return {};
    std::u32string cps = decodeUtf8(text);
    if (cps.size() <= static_cast<size_t>(width)) {
        return std::string(text);
    }
    std::string out;
    for (int i = 0; i < width - 1; ++i) {
        appendUtf8(out, cps[static_cast<size_t>(i)]);
    }
    appendUtf8(out, ELLIPSIS);
    return out;
}

DataViewer::DataViewer(Store& store, std::string kind, SchemaProvider provider)
    : _store(store), _kind(std::move(kind)), _provider(std::move(provider)) {}

//=============================================================================
// Columns
//=============================================================================

Result<std::vector<ColumnSpec>> DataViewer::columns() const {
    if (!_provider) {
        return Err<std::vector<ColumnSpec>>("no schema provider for '" + _kind + "'", VIEWER_CONFIG_ERROR);
    }
    std::vector<ColumnSpec> cols = _provider(_kind);
    if (cols.empty()) {
        return Err<std::vector<ColumnSpec>>("schema for '" + _kind + "' has no columns", VIEWER_CONFIG_ERROR);
    }
    for (size_t i = 0; i < cols.size(); ++i) {
        const auto& col = cols[i];
        if (col.name.empty() || col.label.empty()) {
            return Err<std::vector<ColumnSpec>>("column " + std::to_string(i) + " of '" + _kind +
                                                "' needs a name and a label", VIEWER_CONFIG_ERROR);
        }
        if (col.width <= 0) {
            return Err<std::vector<ColumnSpec>>("column '" + col.name + "' has width " +
                                                std::to_string(col.width), VIEWER_CONFIG_ERROR);
        }
    }
    return Ok(cols);
}

Result<ColumnLayout> DataViewer::computeColumnLayout(int availableWidth) const {
    auto cols = columns();
    if (!cols) {
        return Err<ColumnLayout>("column layout", cols);
    }
    ColumnLayout layout;
    int x = 0;
    for (const auto& col : *cols) {
        layout.offsets.push_back(x);
        layout.widths.push_back(col.width);
        x += col.width + 1;
    }
    layout.contentWidth = x;
    if (layout.contentWidth > availableWidth) {
        return Err<ColumnLayout>("columns of '" + _kind + "' need " + std::to_string(layout.contentWidth) +
                                 " cells, only " + std::to_string(availableWidth) + " available",
                                 VIEWER_CONFIG_ERROR);
    }
    return Ok(layout);
}

//=============================================================================
// Data
//=============================================================================

FieldValue DataViewer::cellValue(const Record& record, const std::string& column) {
    if (column == "id") {
        return FieldValue(record.id());
    }
    return record.get(column);
}

std::string DataViewer::cellText(const Record& record, const std::string& column) {
    return formatValue(cellValue(record, column));
}

bool DataViewer::refresh(bool force) {
    uint64_t digest = _store.digest(_kind);
    if (_fetched && !force && digest == _lastDigest) {
        return false;
    }
    // The old view indexes the old snapshot
    std::string keepId = selectedId();
    _snapshot = _store.getAll(_kind);
    _view.clear();
    _lastDigest = digest;
    _fetched = true;
    rebuild(keepId);
    ydebug("DataViewer: {} refreshed, {} of {} records shown", _kind, _view.size(), _snapshot.size());
    return true;
}

std::string DataViewer::selectedId() const {
    const Record* current = selectedRecord();
    return current ? current->id() : std::string();
}

void DataViewer::rebuild(const std::string& keepId) {

    std::vector<FieldFilter> needles;
    for (const auto& f : _filters) {
        needles.push_back({f.field, lower(f.text)});
    }

    std::vector<size_t> view;
    view.reserve(_snapshot.size());
    for (size_t i = 0; i < _snapshot.size(); ++i) {
        const Record& record = _snapshot[i];
        bool keep = std::all_of(needles.begin(), needles.end(), [&](const FieldFilter& f) {
            return lower(cellText(record, f.field)).find(f.text) != std::string::npos;
        });
        if (keep) view.push_back(i);
    }

    if (_sortColumn) {
        const std::string column = *_sortColumn;
        const bool descending = _sortDirection == SortDirection::Descending;
        std::stable_sort(view.begin(), view.end(), [&](size_t a, size_t b) {
            FieldValue va = cellValue(_snapshot[a], column);
            FieldValue vb = cellValue(_snapshot[b], column);
            // Empty cells stay at the bottom in both directions
            if (isNull(va) != isNull(vb)) return isNull(vb);
            int c = compareValues(va, vb);
            return descending ? c > 0 : c < 0;
        });
    }

    _view = std::move(view);

    if (!keepId.empty()) {
        for (size_t i = 0; i < _view.size(); ++i) {
            if (_snapshot[_view[i]].id() == keepId) {
                _selectedRow = i;
                break;
            }
        }
    }
    clampSelection();
}

void DataViewer::setSort(const std::string& column, SortDirection direction) {
    _sortColumn = column;
    _sortDirection = direction;
    rebuild(selectedId());
}

void DataViewer::clearSort() {
    _sortColumn.reset();
    _sortDirection = SortDirection::Ascending;
    rebuild(selectedId());
}

void DataViewer::toggleSort(const std::string& column) {
    if (_sortColumn && *_sortColumn == column && _sortDirection == SortDirection::Ascending) {
        setSort(column, SortDirection::Descending);
    } else {
        setSort(column, SortDirection::Ascending);
    }
}

void DataViewer::addFilter(const std::string& field, const std::string& text) {
    _filters.push_back({field, text});
    rebuild(selectedId());
}

void DataViewer::clearFilters() {
    _filters.clear();
    rebuild(selectedId());
}

const Record* DataViewer::item(size_t index) const {
    if (index >= _view.size()) return nullptr;
    return &_snapshot[_view[index]];
}

//=============================================================================
// Cursor
//=============================================================================

void DataViewer::clampSelection() {
    if (_view.empty()) {
        _selectedRow = 0;
    } else if (_selectedRow >= _view.size()) {
        _selectedRow = _view.size() - 1;
    }
    ensureVisible();
}

void DataViewer::ensureVisible() {
    if (_viewportRows <= 0 || _view.empty()) {
        _scrollOffset = 0;
        return;
    }
    auto rows = static_cast<size_t>(_viewportRows);
    if (_selectedRow < _scrollOffset) {
        _scrollOffset = _selectedRow;
    } else if (_selectedRow >= _scrollOffset + rows) {
        _scrollOffset = _selectedRow - rows + 1;
    }
    size_t maxOffset = _view.size() > rows ? _view.size() - rows : 0;
    _scrollOffset = std::min(_scrollOffset, maxOffset);
}

void DataViewer::setViewportRows(int rows) {
    _viewportRows = std::max(rows, 0);
    ensureVisible();
}

void DataViewer::moveSelection(int delta) {
    if (_view.empty()) {
        _selectedRow = 0;
        ensureVisible();
        return;
    }
    long long target = static_cast<long long>(_selectedRow) + delta;
    long long last = static_cast<long long>(_view.size()) - 1;
    _selectedRow = static_cast<size_t>(std::clamp(target, 0LL, last));
    ensureVisible();
}

void DataViewer::pageUp() {
    moveSelection(-std::max(_viewportRows, 1));
}

void DataViewer::pageDown() {
    moveSelection(std::max(_viewportRows, 1));
}

void DataViewer::selectFirst() {
    _selectedRow = 0;
    ensureVisible();
}

void DataViewer::selectLast() {
    _selectedRow = _view.empty() ? 0 : _view.size() - 1;
    ensureVisible();
}

void DataViewer::selectRecord(const std::string& id) {
    for (size_t i = 0; i < _view.size(); ++i) {
        if (_snapshot[_view[i]].id() == id) {
            _selectedRow = i;
            ensureVisible();
            return;
        }
    }
}

void DataViewer::moveColumn(int delta) {
    auto cols = columns();
    if (!cols) {
        _selectedColumn = 0;
        return;
    }
    long long target = static_cast<long long>(_selectedColumn) + delta;
    long long last = static_cast<long long>(cols->size()) - 1;
    _selectedColumn = static_cast<size_t>(std::clamp(target, 0LL, last));
}

//=============================================================================
// Output
//=============================================================================

std::string DataViewer::queryDescription() const {
    std::string desc = _kind;
    for (size_t i = 0; i < _filters.size(); ++i) {
        desc += i == 0 ? " where " : " and ";
        desc += _filters[i].field + " contains \"" + _filters[i].text + "\"";
    }
    if (_sortColumn) {
        desc += " order by " + *_sortColumn;
        desc += _sortDirection == SortDirection::Descending ? " desc" : " asc";
    }
    return desc;
}

std::optional<Region> DataViewer::selectedCellRect(const Region& content) const {
    if (_view.empty() || _selectedRow < _scrollOffset) {
        return std::nullopt;
    }
    size_t visibleRow = _selectedRow - _scrollOffset;
    int dataRows = content.height - 1;
    if (dataRows <= 0 || visibleRow >= static_cast<size_t>(dataRows)) {
        return std::nullopt;
    }
    auto layout = computeColumnLayout(content.width);
    if (!layout || _selectedColumn >= layout->offsets.size()) {
        return std::nullopt;
    }
    Region rect;
    rect.kind = RegionKind::Content;
    rect.x = content.x + layout->offsets[_selectedColumn];
    rect.y = content.y + 1 + static_cast<int>(visibleRow);
    rect.width = layout->widths[_selectedColumn];
    rect.height = 1;
    return rect;
}

Result<void> DataViewer::render(ScreenBuffer& buffer, const Region& content, const Region& status,
                                const Theme& theme, bool gridFocus, const EditOverlay* edit) const {
    auto cols = columns();
    if (!cols) {
        return Err<void>("render " + _kind, cols);
    }
    auto layout = computeColumnLayout(content.width);
    if (!layout) {
        return Err<void>("render " + _kind, layout);
    }

    buffer.fill(content.x, content.y, content.width, content.height, ScreenCell(U' ', theme.row));

    if (content.height > 0) {
        // Header row
        buffer.fill(content.x, content.y, content.width, 1, ScreenCell(U' ', theme.gridHeader));
        for (size_t c = 0; c < cols->size(); ++c) {
            int x = content.x + layout->offsets[c];
            buffer.setText(x, content.y, truncateText((*cols)[c].label, layout->widths[c]), theme.gridHeader);
            buffer.set(x + layout->widths[c], content.y, ScreenCell(SEPARATOR, theme.gridHeader));
        }

        int dataRows = content.height - 1;
        for (int r = 0; r < dataRows; ++r) {
            size_t index = _scrollOffset + static_cast<size_t>(r);
            const Record* record = item(index);
            if (!record) break;

            const bool selected = index == _selectedRow;
            const CellStyle& rowStyle = selected ? theme.selectedRow : theme.row;
            int y = content.y + 1 + r;
            buffer.fill(content.x, y, content.width, 1, ScreenCell(U' ', rowStyle));

            for (size_t c = 0; c < cols->size(); ++c) {
                int x = content.x + layout->offsets[c];
                int w = layout->widths[c];
                const bool isCell = selected && gridFocus && c == _selectedColumn;
                if (isCell && edit) {
                    continue;
                }
                const CellStyle& style = isCell ? theme.selectedCell : rowStyle;
                drawClipped(buffer, x, y, w, cellText(*record, (*cols)[c].name), style);
                buffer.set(x + w, y, ScreenCell(SEPARATOR, rowStyle));
            }
        }

        if (edit && gridFocus) {
            if (auto rect = selectedCellRect(content)) {
                std::u32string cps = decodeUtf8(edit->text);
                size_t cursor = std::min(edit->cursor, cps.size());
                auto w = static_cast<size_t>(rect->width);
                // Scroll the text so the cursor stays inside the cell
                size_t start = cursor >= w ? cursor - w + 1 : 0;
                std::string visible;
                for (size_t i = start; i < cps.size() && i < start + w; ++i) {
                    appendUtf8(visible, cps[i]);
                }
                buffer.fill(rect->x, rect->y, rect->width, 1, ScreenCell(U' ', theme.editCell));
                buffer.setText(rect->x, rect->y, visible, theme.editCell);
                buffer.set(rect->x + rect->width, rect->y, ScreenCell(SEPARATOR, theme.selectedRow));
            }
        }
    }

    if (!status.empty()) {
        std::string line = " " + std::to_string(_view.size()) +
                           (_view.size() == 1 ? " item" : " items") + " | " + queryDescription();
        drawClipped(buffer, status.x, status.y, status.width, line, theme.status);
    }
    return Ok();
}

} // namespace pmc
