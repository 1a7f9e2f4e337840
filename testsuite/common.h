

#ifndef COMMON_H
#define COMMON_H


#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <functional>

#include "diskprov/CommandRunner.h"
#include "diskprov/Layout.h"
#include "diskprov/RunReport.h"
#include "diskprov/Utils/DiskprovTmpl.h"


namespace diskprov
{

    void check_failure(const char* str, const char* file, int line, const char* func);

#define check(expr) ((expr) ? (void)(0) : diskprov::check_failure(#expr, __FILE__, __LINE__, \
								  __PRETTY_FUNCTION__))

#define check_throw(expr, exception)					\
    do {								\
	bool _thrown = false;						\
	try { expr; } catch (const exception&) { _thrown = true; }	\
	if (!_thrown)							\
	    diskprov::check_failure(#expr " throws " #exception, __FILE__, __LINE__, \
				    __PRETTY_FUNCTION__);		\
    } while (0)


    void setup_logger();


    /**
     * CommandRunner recording the commands instead of executing them.
     * Every command succeeds unless a failure was registered for its
     * program.
     */
    class StubRunner : public CommandRunner
    {
    public:

	StubRunner();

	virtual CommandResult execute(const Command& command);

	/**
	 * The next times executions of the program exit with exit_code.
	 */
	void failProgram(const string& program, unsigned times, int exit_code = 1);

	/**
	 * Output and exit code of a program or of one full command line,
	 * e.g. "wipefs --no-act --noheadings --output TYPE /dev/test-a1".
	 * A command line wins over its program. Without output blockdev
	 * reports 10 GiB and everything else prints nothing.
	 */
	void setOutput(const string& key, const vector<string>& stdout_lines, int exit_code = 0);

	/**
	 * Called before every command, outside of the lock.
	 */
	void setHook(const std::function<void(const Command&)>& value) { hook = value; }

	vector<Command> getCommands() const;

	unsigned numCalls(const string& program) const;

	/**
	 * The command lines, e.g. "mkfs.fat -F 32 /dev/test-a1".
	 */
	vector<string> getLines() const;

    private:

	mutable std::mutex mutex;

	vector<Command> commands;
	std::map<string, std::pair<unsigned, int>> failures;
	std::map<string, CommandResult> outputs;

	std::function<void(const Command&)> hook;

    };


    /**
     * One disk /dev/test-a with an EFI partition labeled EFI and mounted
     * at /mnt/efi.
     */
    Layout simple_layout();

    /**
     * Disks /dev/test-a to /dev/test-d, each with one partition, and a
     * btrfs raid0 over all of them mounted at /mnt/data.
     */
    Layout raid_layout(const vector<string>& disks);


    const StepResult& find_result(const vector<StepResult>& results, const string& text);

}


#endif
