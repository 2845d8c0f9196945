#include "cli/ResultPrinter.h"

#include <iomanip>
#include <algorithm>
#include <string>

namespace FileCommander {
namespace CLI {

void ResultPrinter::printSearchTable(const std::vector<SearchRow>& rows) const {
    if (rows.empty()) {
        return;
    }

    size_t indexWidth = 1;
    size_t nameWidth = 9;   // "File Name"
    size_t pathWidth = 4;   // "Path"
    for (const auto& row : rows) {
        indexWidth = std::max(indexWidth, std::to_string(row.index).size());
        nameWidth = std::max(nameWidth, row.fileName.size());
        pathWidth = std::max(pathWidth, row.directory.size());
    }

    auto rule = [&]() {
        m_out << "+" << std::string(indexWidth + 2, '-')
              << "+" << std::string(nameWidth + 2, '-')
              << "+" << std::string(pathWidth + 2, '-') << "+\n";
    };

    m_out << "Search Results\n";
    rule();
    m_out << std::left
          << "| " << std::setw(static_cast<int>(indexWidth)) << "#"
          << " | " << std::setw(static_cast<int>(nameWidth)) << "File Name"
          << " | " << std::setw(static_cast<int>(pathWidth)) << "Path" << " |\n";
    rule();
    for (const auto& row : rows) {
        m_out << "| " << std::setw(static_cast<int>(indexWidth)) << row.index
              << " | " << std::setw(static_cast<int>(nameWidth)) << row.fileName
              << " | " << std::setw(static_cast<int>(pathWidth)) << row.directory << " |\n";
    }
    rule();
}

void ResultPrinter::print(const std::vector<StepResult>& results) const {
    if (results.size() == 1) {
        printSearchTable(results[0].rows);
        m_out << "Result: " << results[0].message << "\n";
        return;
    }

    for (size_t i = 0; i < results.size(); ++i) {
        printSearchTable(results[i].rows);
        m_out << "Step " << (i + 1) << ": " << results[i].message << "\n";
    }
}

} // namespace CLI
} // namespace FileCommander
