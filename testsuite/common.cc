

#include <stdlib.h>
#include <iostream>
#include <boost/algorithm/string.hpp>

#include "common.h"

#include "diskprov/Utils/AppUtil.h"
#include "diskprov/Utils/Exception.h"


extern char* program_invocation_short_name;


namespace diskprov
{
    using namespace std;


    void
    check_failure(const char* str, const char* file, int line, const char* func)
    {
	cerr << "check failed: " << str << endl
	     << "  in " << func << " at " << file << ":" << line << endl;
	exit(EXIT_FAILURE);
    }


    void
    setup_logger()
    {
	string name = program_invocation_short_name;
	createLogger("default", ".", name + ".log", "debug");

	// tests never touch the global lock
	setenv("DISKPROV_NO_LOCKING", "1", 1);
    }


    StubRunner::StubRunner()
    {
    }


    CommandResult
    StubRunner::execute(const Command& command)
    {
	if (hook)
	    hook(command);

	const string program = command.args.empty() ? string() : command.args.front();

	if (!command.destructive && aborted())
	    DP_THROW(CommandCancelledException(command.text()));

	CommandResult result;

	{
	    lock_guard<std::mutex> lock(mutex);

	    commands.push_back(command);

	    map<string, pair<unsigned, int>>::iterator it = failures.find(program);
	    if (it != failures.end() && it->second.first > 0)
	    {
		--it->second.first;
		result.exit_code = it->second.second;
		result.stderr.push_back(program + ": simulated failure");
	    }
	}

	if (result.exit_code == 0)
	{
	    lock_guard<std::mutex> lock(mutex);

	    map<string, CommandResult>::const_iterator it = outputs.find(boost::join(command.args, " "));
	    if (it == outputs.end())
		it = outputs.find(program);

	    if (it != outputs.end())
		result = it->second;
	    else if (program == "blockdev")
		result.stdout.push_back("10737418240");
	}

	checkResult(command, result);

	return result;
    }


    void
    StubRunner::failProgram(const string& program, unsigned times, int exit_code)
    {
	lock_guard<std::mutex> lock(mutex);
	failures[program] = make_pair(times, exit_code);
    }


    void
    StubRunner::setOutput(const string& key, const vector<string>& stdout_lines, int exit_code)
    {
	lock_guard<std::mutex> lock(mutex);

	CommandResult result;
	result.exit_code = exit_code;
	result.stdout = stdout_lines;
	outputs[key] = result;
    }


    vector<Command>
    StubRunner::getCommands() const
    {
	lock_guard<std::mutex> lock(mutex);
	return commands;
    }


    unsigned
    StubRunner::numCalls(const string& program) const
    {
	lock_guard<std::mutex> lock(mutex);

	unsigned ret = 0;
	for (vector<Command>::const_iterator it = commands.begin(); it != commands.end(); ++it)
	    if (!it->args.empty() && it->args.front() == program)
		++ret;
	return ret;
    }


    vector<string>
    StubRunner::getLines() const
    {
	const vector<Command> tmp = getCommands();

	vector<string> ret;
	for (vector<Command>::const_iterator it = tmp.begin(); it != tmp.end(); ++it)
	    ret.push_back(boost::join(it->args, " "));
	return ret;
    }


    static const unsigned long long MiB = 1024 * 1024;


    Layout
    simple_layout()
    {
	Layout layout;

	layout.addDisk(Disk("/dev/test-a", ROLE_BOOT));

	layout.addPartition(Partition("/dev/test-a", 1, 1 * MiB, 512 * MiB, "fat32"));

	Filesystem efi("efi", FAT32);
	efi.devices.push_back("/dev/test-a1");
	efi.label = "EFI";
	layout.addFilesystem(efi);

	layout.addMount(Mount("efi", "/mnt/efi"));

	return layout;
    }


    Layout
    raid_layout(const vector<string>& disks)
    {
	Layout layout;

	Filesystem data("data", BTRFS);
	data.data_profile = "raid0";
	data.metadata_profile = "raid0";

	for (vector<string>::const_iterator it = disks.begin(); it != disks.end(); ++it)
	{
	    layout.addDisk(Disk(*it, ROLE_RAID_MEMBER));

	    Partition partition(*it, 1, 1 * MiB, 0, "btrfs");
	    partition.to_end = true;
	    layout.addPartition(partition);

	    data.devices.push_back(partition.device());
	}

	layout.addFilesystem(data);
	layout.addMount(Mount("data", "/mnt/data"));

	return layout;
    }


    const StepResult&
    find_result(const vector<StepResult>& results, const string& text)
    {
	for (vector<StepResult>::const_iterator it = results.begin(); it != results.end(); ++it)
	    if (it->text == text)
		return *it;

	check_failure(("no result for " + text).c_str(), __FILE__, __LINE__, __PRETTY_FUNCTION__);
	return results.front();
    }

}
