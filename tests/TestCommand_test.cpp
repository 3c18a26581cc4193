#include "test_utils.hpp"
#include "commands/TestCommand.hpp"

class TestCommandTest : public CmdTestBase<TestCommand> {};

TEST_F(TestCommandTest, selftest_passes) {
    run_cmd({"test"});
}
