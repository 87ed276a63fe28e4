#include <gtest/gtest.h>
#include "ledger/board_report.hpp"
#include "ledger/errors.hpp"

using namespace ledger;

namespace {

const char* const ACTIVE_REPORT =
    "status: active\n"
    "player 1: 0x9a1f\n"
    "player 2: 0x77c2\n"
    "\n"
    "    A B C D E F G H\n"
    "  -------------------\n"
    "1 | b . b . b . b . |\n"
    "2 | . b . b . b . b |\n"
    "3 | b . b . b . b . |\n"
    "4 | . . . . . . . . |\n"
    "5 | . . . . . . . . |\n"
    "6 | . r . r . r . r |\n"
    "7 | r . r . r . r . |\n"
    "8 | . r . r . r . R |\n"
    "  -------------------\n";

} // namespace

class BoardReportTest : public ::testing::Test {
protected:
    std::string replace_line(const std::string& text, const std::string& from, const std::string& to) {
        std::string out = text;
        auto pos = out.find(from);
        EXPECT_NE(pos, std::string::npos);
        out.replace(pos, from.size(), to);
        return out;
    }
};

TEST_F(BoardReportTest, ParsesHeaderAndBoard) {
    BoardReport report = parse_board_report(ACTIVE_REPORT);

    EXPECT_EQ(report.status, MatchStatus::Active);
    EXPECT_EQ(report.player1, "0x9a1f");
    EXPECT_EQ(report.player2, "0x77c2");

    EXPECT_EQ(report.board.get_piece(0, 0), core::Piece::BlackMan);
    EXPECT_EQ(report.board.get_piece(7, 7), core::Piece::RedKing);
    EXPECT_EQ(report.board.count(core::Side::Red), 12);
    EXPECT_EQ(report.board.count(core::Side::Black), 12);
}

TEST_F(BoardReportTest, StatusNames) {
    EXPECT_EQ(parse_status("not started"), MatchStatus::NotStarted);
    EXPECT_EQ(parse_status("  Waiting For Join "), MatchStatus::WaitingForJoin);
    EXPECT_EQ(parse_status("ACTIVE"), MatchStatus::Active);
    EXPECT_EQ(parse_status("red won"), MatchStatus::Finished);
    EXPECT_STREQ(status_name(MatchStatus::WaitingForJoin), "waiting for join");
}

TEST_F(BoardReportTest, FormatRoundTrips) {
    BoardReport report;
    report.status = MatchStatus::WaitingForJoin;
    report.player1 = "alice";
    report.board = core::Board::standard();

    BoardReport parsed = parse_board_report(format_board_report(report));
    EXPECT_EQ(parsed.status, report.status);
    EXPECT_EQ(parsed.player1, "alice");
    EXPECT_EQ(parsed.player2, "");
    EXPECT_EQ(parsed.board, report.board);
}

TEST_F(BoardReportTest, ToleratesCarriageReturnsAndLeadingBlankLines) {
    std::string text = "\n\n";
    for (char ch : std::string(ACTIVE_REPORT)) {
        if (ch == '\n') text += '\r';
        text += ch;
    }
    BoardReport report = parse_board_report(text);
    EXPECT_EQ(report.status, MatchStatus::Active);
    EXPECT_EQ(report.player2, "0x77c2");
}

TEST_F(BoardReportTest, RejectsMissingHeader) {
    EXPECT_THROW(parse_board_report(""), ParseError);
    EXPECT_THROW(parse_board_report("status: active\n"), ParseError);
    EXPECT_THROW(parse_board_report(replace_line(ACTIVE_REPORT, "player 1:", "owner:")), ParseError);
}

TEST_F(BoardReportTest, RejectsBadCells) {
    EXPECT_THROW(parse_board_report(replace_line(ACTIVE_REPORT, "4 | . . . . . . . . |",
                                                 "4 | . . . x . . . . |")),
                 ParseError);
    EXPECT_THROW(parse_board_report(replace_line(ACTIVE_REPORT, "5 | . . . . . . . . |",
                                                 "5 | . . . . . . . |")),
                 ParseError);
}

TEST_F(BoardReportTest, RejectsWrongRowCount) {
    EXPECT_THROW(parse_board_report(replace_line(ACTIVE_REPORT, "8 | . r . r . r . R |\n", "")),
                 ParseError);
    EXPECT_THROW(parse_board_report(std::string(ACTIVE_REPORT) + "9 | . . . . . . . . |\n"),
                 ParseError);
}
