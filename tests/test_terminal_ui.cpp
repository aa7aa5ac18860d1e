#include "TerminalUI.h"
#include "TestFixtures.h"

#include <gtest/gtest.h>

#include <iostream>

using namespace MenderTest;

TEST(TerminalUITest, TablesLeaveCoutFormattingUntouched) {
    const std::ios_base::fmtflags flags = std::cout.flags();
    const std::streamsize precision = std::cout.precision();

    const SessionResult result = ImputationSession(SessionOptions{}).run(studentRecords(), {"age", "grade"}, 1);

    testing::internal::CaptureStdout();
    TerminalUI::printMissingnessTable({{"age", 2, 25.0}, {"grade", 0, 0.0}});
    TerminalUI::printComparisonTable(result.comparisons);
    std::cout << 1.5 << "|" << 100.0 / 3.0 << "\n";
    const std::string out = testing::internal::GetCapturedStdout();

    EXPECT_EQ(std::cout.flags(), flags);
    EXPECT_EQ(std::cout.precision(), precision);
    EXPECT_NE(out.find("25.00"), std::string::npos);
    EXPECT_NE(out.find("\n1.5|33.3333\n"), std::string::npos) << out;
}
