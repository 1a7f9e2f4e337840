

#include <iostream>
#include <chrono>
#include <thread>

#include "common.h"

#include "diskprov/Utils/SystemCmd.h"
#include "diskprov/Utils/Exception.h"


using namespace std;
using namespace diskprov;


void
system_cmd()
{
    SystemCmd cmd;

    check(cmd.execute({ "true" }) == 0);
    check(cmd.retcode() == 0);

    check(cmd.execute({ "false" }) == 1);

    check(cmd.execute({ "echo", "hello world", "'quoted'" }) == 0);
    check(cmd.stdout() == vector<string>({ "hello world 'quoted'" }));
    check(cmd.stderr().empty());

    // no shell is involved
    check(cmd.execute({ "echo", "$HOME", ";", "false" }) == 0);
    check(cmd.stdout() == vector<string>({ "$HOME ; false" }));

    check(cmd.execute({ "sh", "-c", "echo out; echo err >&2; exit 3" }) == 3);
    check(cmd.stdout() == vector<string>({ "out" }));
    check(cmd.stderr() == vector<string>({ "err" }));

    cmd.execute({ "diskprov-no-such-program" });
    check(cmd.notFound());

    cmd.execute({ "sleep", "10" }, 1);
    check(cmd.timedOut());

    std::atomic<bool> abort(true);
    cmd.execute({ "sleep", "10" }, 0, &abort);
    check(cmd.aborted());

    check(!SystemCmd::findProgram("sh").empty());
    check(SystemCmd::findProgram("diskprov-no-such-program").empty());
}


// the program closes stdout and stderr and keeps running
void
closed_output()
{
    const vector<string> args = { "sh", "-c", "exec >&- 2>&-; sleep 10" };

    SystemCmd cmd;

    chrono::steady_clock::time_point start = chrono::steady_clock::now();
    cmd.execute(args, 1);
    check(cmd.timedOut());
    check(cmd.retcode() < 0);
    check(chrono::steady_clock::now() - start < chrono::seconds(5));

    std::atomic<bool> abort(false);
    std::thread canceller([&abort]() {
	std::this_thread::sleep_for(chrono::milliseconds(500));
	abort = true;
    });

    start = chrono::steady_clock::now();
    cmd.execute(args, 0, &abort);
    canceller.join();
    check(cmd.aborted());
    check(chrono::steady_clock::now() - start < chrono::seconds(5));
}


void
quoting()
{
    check(SystemCmd::quote("/dev/sda1") == "/dev/sda1");
    check(SystemCmd::quote("a b") == "'a b'");
    check(SystemCmd::quote("it's") == "'it'\\''s'");
    check(SystemCmd::quote("") == "''");

    vector<string> args = { "parted", "-s", "/dev/sda", "mkpart", "my root", "1048576B", "100%" };
    check(SystemCmd::quote(args) == "parted -s /dev/sda mkpart 'my root' 1048576B 100%");
}


void
runner()
{
    SystemCmdRunner runner(10, 1);

    CommandResult result = runner.execute(Command({ "echo", "ok" }, false));
    check(result.exit_code == 0);
    check(result.stdout == vector<string>({ "ok" }));

    check_throw(runner.execute(Command({ "false" }, false)), CommandNonZeroExitException);

    try
    {
	runner.execute(Command({ "sh", "-c", "echo broken >&2; exit 4" }, true));
	check(false);
    }
    catch (const CommandNonZeroExitException& e)
    {
	check(e.exitCode() == 4);
	check(e.getStderr() == vector<string>({ "broken" }));
	check(e.errorKind() == ERR_COMMAND_NON_ZERO_EXIT);
    }

    Command accepted({ "sh", "-c", "exit 2" }, false);
    accepted.ok_codes = { 0, 2 };
    check(runner.execute(accepted).exit_code == 2);

    check_throw(runner.execute(Command({ "diskprov-no-such-program" }, false)),
		CommandNotFoundException);

    // the default timeout of non-destructive commands is one second
    check_throw(runner.execute(Command({ "sleep", "10" }, false)), CommandTimeoutException);

    std::atomic<bool> abort(true);
    runner.setAbortFlag(&abort);

    check_throw(runner.execute(Command({ "true" }, false)), CommandCancelledException);

    // destructive commands are never cancelled
    check(runner.execute(Command({ "true" }, true)).exit_code == 0);

    runner.setAbortFlag(nullptr);
}


int
main()
{
    setup_logger();

    system_cmd();
    closed_output();
    quoting();
    runner();

    cout << "systemcmd ok" << endl;
}
