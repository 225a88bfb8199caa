#include "crossword_board.h"
#include "placement_engine.h"
#include "test_helpers.h"
#include <gtest/gtest.h>
#include <string.h>

/*
 *     0 1 2
 *  0  # C #
 *  1  C A T      CAR down from (0,1) = D1, CAT across from (1,0) = A2
 *  2  # R #
 */
class CrosswordBoardTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        pool = make_pool({ "CAR", "CAT" });
        memset(entries, 0, sizeof(entries));
        set_entry(0, &pool[0], DIRECTION_DOWN, 0, 1);
        set_entry(1, &pool[1], DIRECTION_ACROSS, 1, 0);
        layout.rows = 5;
        layout.cols = 5;
        layout.entry_count = 2;
        layout.entries = entries;
        ASSERT_TRUE(assign_entry_numbers(&layout));
    }

    void set_entry(int i, const crossword_word_t* pWord, direction_t direction, int row, int col)
    {
        entries[i].pWord = pWord;
        entries[i].direction = direction;
        entries[i].row = row;
        entries[i].col = col;
    }

    std::vector<crossword_word_t> pool;
    crossword_entry_t entries[3];
    crossword_layout_t layout;
};

TEST_F(CrosswordBoardTest, DerivesCellsAndNumbers)
{
    crossword_board_t board;
    ASSERT_TRUE(board_build(&layout, &board));

    EXPECT_EQ(5, board.letter_cell_count);
    EXPECT_EQ('\0', board_cell(&board, 0, 0)->expected);
    EXPECT_EQ('C', board_cell(&board, 0, 1)->expected);
    EXPECT_EQ('A', board_cell(&board, 1, 1)->expected);
    EXPECT_EQ(1, board_cell(&board, 0, 1)->number);
    EXPECT_EQ(2, board_cell(&board, 1, 0)->number);
    EXPECT_EQ(0, board_cell(&board, 1, 1)->number);

    const board_cell_t* pCross = board_cell(&board, 1, 1);
    EXPECT_EQ(1, pCross->across_entry);
    EXPECT_EQ(0, pCross->down_entry);
    EXPECT_EQ(-1, board_cell(&board, 1, 2)->down_entry);

    EXPECT_TRUE(board_cell(&board, -1, 0) == NULL);
    EXPECT_TRUE(board_cell(&board, 0, 5) == NULL);

    board_free(&board);
}

TEST_F(CrosswordBoardTest, FindsEntriesById)
{
    crossword_board_t board;
    ASSERT_TRUE(board_build(&layout, &board));

    EXPECT_EQ(0, board_find_entry(&board, "D1"));
    EXPECT_EQ(1, board_find_entry(&board, "a2"));
    EXPECT_EQ(-1, board_find_entry(&board, "A1"));
    EXPECT_EQ(-1, board_find_entry(&board, "A"));
    EXPECT_EQ(-1, board_find_entry(&board, NULL));

    board_free(&board);
}

TEST_F(CrosswordBoardTest, ClueListsOrderedByNumber)
{
    // A third entry placed last but numbered first among the Across clues.
    std::vector<crossword_word_t> extra = make_pool({ "DOG" });
    set_entry(2, &extra[0], DIRECTION_ACROSS, 0, 2);
    layout.entry_count = 3;
    ASSERT_TRUE(assign_entry_numbers(&layout));

    crossword_board_t board;
    ASSERT_TRUE(board_build(&layout, &board));

    ASSERT_EQ(2, board.across_count);
    ASSERT_EQ(1, board.down_count);
    EXPECT_EQ(2, board.p_across[0]);
    EXPECT_EQ(1, board.p_across[1]);
    EXPECT_EQ(0, board.p_down[0]);

    board_free(&board);
}

TEST_F(CrosswordBoardTest, RejectsConflictingLetters)
{
    std::vector<crossword_word_t> other = make_pool({ "CUT" });
    entries[1].pWord = &other[0];

    crossword_board_t board;
    EXPECT_FALSE(board_build(&layout, &board));
    EXPECT_TRUE(board.cells == NULL);
}

TEST_F(CrosswordBoardTest, RejectsEntryOffTheBoard)
{
    entries[1].col = 3;

    crossword_board_t board;
    EXPECT_FALSE(board_build(&layout, &board));
}
