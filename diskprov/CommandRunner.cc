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


#include <algorithm>

#include "diskprov/CommandRunner.h"
#include "diskprov/Utils/SystemCmd.h"
#include "diskprov/Utils/Exception.h"
#include "diskprov/Utils/AppUtil.h"


namespace diskprov
{

    string
    Command::text() const
    {
	return quote(args);
    }


    std::ostream&
    operator<<(std::ostream& s, const Command& command)
    {
	s << command.text();
	if (command.destructive)
	    s << " (destructive)";
	return s;
    }


    void
    CommandRunner::checkResult(const Command& command, const CommandResult& result) const
    {
	if (std::find(command.ok_codes.begin(), command.ok_codes.end(), result.exit_code) ==
	    command.ok_codes.end())
	    DP_THROW(CommandNonZeroExitException(command.text(), result.exit_code, result.stderr));
    }


    SystemCmdRunner::SystemCmdRunner(unsigned destructive_timeout, unsigned timeout)
	: destructive_timeout(destructive_timeout), timeout(timeout)
    {
    }


    CommandResult
    SystemCmdRunner::execute(const Command& command)
    {
	unsigned t = command.timeout;
	if (t == 0)
	    t = command.destructive ? destructive_timeout : timeout;

	// a destructive command is never killed half way through
	const std::atomic<bool>* flag = command.destructive ? nullptr : abort;

	if (flag && flag->load())
	    DP_THROW(CommandCancelledException(command.text()));

	SystemCmd cmd;
	cmd.execute(command.args, t, flag);

	if (cmd.notFound())
	    DP_THROW(CommandNotFoundException(command.text(), command.args.empty() ? string() :
					      command.args.front()));

	if (cmd.timedOut())
	    DP_THROW(CommandTimeoutException(command.text(), t, cmd.stderr()));

	if (cmd.aborted())
	    DP_THROW(CommandCancelledException(command.text()));

	CommandResult result;
	result.exit_code = cmd.retcode();
	result.stdout = cmd.stdout();
	result.stderr = cmd.stderr();

	checkResult(command, result);

	return result;
    }

}
