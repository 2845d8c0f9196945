#ifndef CLI_RESULT_PRINTER_H
#define CLI_RESULT_PRINTER_H

#include "operations/Operation.h"
#include <ostream>
#include <vector>

namespace FileCommander {
namespace CLI {

/**
 * Renders step results for the terminal
 *
 * A plan of one prints "Result: <message>"; longer plans print
 * "Step i: <message>" per step. Search rows are shown as a table
 * above the line of the step that produced them.
 */
class ResultPrinter {
public:
    explicit ResultPrinter(std::ostream& out) : m_out(out) {}

    void print(const std::vector<StepResult>& results) const;

    void printSearchTable(const std::vector<SearchRow>& rows) const;

private:
    std::ostream& m_out;
};

} // namespace CLI
} // namespace FileCommander

#endif // CLI_RESULT_PRINTER_H
