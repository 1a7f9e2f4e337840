/*
 * Copyright (c) [2026] diskprov authors
 *
 * All Rights Reserved.
 *
 * This program is free software; you can redistribute it and/or modify it
 * under the terms of version 2 of the GNU General Public License as published
 * by the Free Software Foundation.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT
 * ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
 * FITNESS FOR A PARTICULAR PURPOSE.  See the GNU General Public License for
 * more details.
 *
 * You should have received a copy of the GNU General Public License along
 * with this program; if not, see <http://www.gnu.org/licenses/>.
 */


#ifndef COMMAND_RUNNER_H
#define COMMAND_RUNNER_H


#include <string>
#include <vector>
#include <atomic>
#include <ostream>


namespace diskprov
{
    using std::string;
    using std::vector;


    /**
     * One invocation of an external program. args[0] is the program name,
     * looked up in PATH.
     */
    struct Command
    {
	Command(const vector<string>& args, bool destructive)
	    : args(args), destructive(destructive), timeout(0), ok_codes(1, 0) {}

	vector<string> args;

	// destructive commands get the longer timeout and are never interrupted
	bool destructive;

	// timeout in seconds, 0 means the default of the runner
	unsigned timeout;

	// exit codes treated as success
	vector<int> ok_codes;

	string text() const;

	friend std::ostream& operator<<(std::ostream& s, const Command& command);
    };


    struct CommandResult
    {
	CommandResult() : exit_code(0) {}

	int exit_code;
	vector<string> stdout;
	vector<string> stderr;
    };


    /**
     * Executes commands. Failures are reported by exceptions derived from
     * SystemCmdException: CommandNotFoundException,
     * CommandTimeoutException, CommandNonZeroExitException and
     * CommandCancelledException.
     *
     * Implementations must be callable from several threads at once.
     */
    class CommandRunner
    {
    public:

	CommandRunner() : abort(nullptr) {}
	virtual ~CommandRunner() {}

	virtual CommandResult execute(const Command& command) = 0;

	/**
	 * Non-destructive commands are interrupted once the flag is set.
	 */
	void setAbortFlag(const std::atomic<bool>* flag) { abort = flag; }

    protected:

	bool aborted() const { return abort && abort->load(); }

	/**
	 * Throws CommandNonZeroExitException unless the exit code of the
	 * result is accepted by the command.
	 */
	void checkResult(const Command& command, const CommandResult& result) const;

	const std::atomic<bool>* abort;

    };


    /**
     * Runs the commands on the system using SystemCmd.
     */
    class SystemCmdRunner : public CommandRunner
    {
    public:

	SystemCmdRunner(unsigned destructive_timeout = 300, unsigned timeout = 60);

	virtual CommandResult execute(const Command& command);

    private:

	unsigned destructive_timeout;
	unsigned timeout;

    };

}


#endif
