

#include <getopt.h>
#include <signal.h>
#include <stdlib.h>
#include <string.h>
#include <iostream>
#include <atomic>
#include <set>
#include <boost/algorithm/string.hpp>

#include "diskprov/Layout.h"
#include "diskprov/LayoutFile.h"
#include "diskprov/Orchestrator.h"
#include "diskprov/Graph.h"
#include "diskprov/Utils/AppUtil.h"
#include "diskprov/Utils/Exception.h"
#include "diskprov/Utils/DiskprovTmpl.h"

using namespace std;
using namespace diskprov;


enum { EXIT_COMPLETED = 0, EXIT_HALTED = 1, EXIT_INVALID = 2, EXIT_DECLINED = 3 };


const char* program_name;

// read by the signal handler
std::atomic<Orchestrator*> orchestrator(nullptr);


void help() __attribute__ ((__noreturn__));

void
help()
{
    cout << "Usage: " << program_name << " apply [OPTION]..." << endl
	 << endl
	 << "Wipes, partitions, formats and mounts the disks described in a layout file." << endl
	 << endl
	 << "Mandatory arguments to long options are mandatory for short options too." << endl
	 << "  -l, --layout=FILE     layout file (required)" << endl
	 << "  -n, --dry-run         only validate and print the plan" << endl
	 << "  -w, --workers=N       number of worker threads (default one per disk)" << endl
	 << "  -y, --yes             do not ask for confirmation" << endl
	 << "  -k, --keep-going      keep working on disks not affected by a failure" << endl
	 << "  -r, --report=FILE     save the run report as XML" << endl
	 << "  -g, --graph=FILE      save the plan as graphviz dot file" << endl
	 << "  -c, --config=FILE     read settings from FILE (default " SYSCONFIGFILE ")" << endl
	 << "      --logfile=FILE    log into FILE (default /var/log/diskprov.log)" << endl
	 << "  -v, --verbose         log debug messages" << endl
	 << endl
	 << "  -h, --help            show this help" << endl
	 << endl
	 << "Exit status is 0 if all steps succeeded, 1 if the run halted, 2 if the layout" << endl
	 << "is invalid and 3 if the confirmation was declined." << endl;

    exit(EXIT_SUCCESS);
}


void usage() __attribute__ ((__noreturn__));

void
usage()
{
    cerr << "Try " << program_name << " --help for more information." << endl;
    exit(EXIT_INVALID);
}


void
signal_handler(int signum)
{
    Orchestrator* tmp = orchestrator.load();
    if (tmp)
	tmp->cancel();
}


void
install_signal_handlers()
{
    struct sigaction action;
    memset(&action, 0, sizeof(action));
    action.sa_handler = signal_handler;
    sigemptyset(&action.sa_mask);

    sigaction(SIGINT, &action, NULL);
    sigaction(SIGTERM, &action, NULL);
}


bool
confirm(const Plan& plan)
{
    set<string> disks;

    const vector<Step>& steps = plan.getSteps();
    for (vector<Step>::const_iterator it = steps.begin(); it != steps.end(); ++it)
	if (it->isDestructive())
	    disks.insert(it->disks.begin(), it->disks.end());

    if (disks.empty())
	return true;

    cout << "ALL DATA on " << boost::join(disks, ", ") << " will be destroyed." << endl
	 << "Type 'yes' to continue: " << flush;

    string answer;
    if (!getline(cin, answer))
	return false;

    return boost::trim_copy(answer) == "yes";
}


int
main(int argc, char** argv)
{
    program_name = argv[0];

    enum { OPT_LOGFILE = 256 };

    string layout_file;
    bool dry_run = false;
    string workers;
    bool yes = false;
    bool keep_going = false;
    string report_file;
    string graph_file;
    string config_file = SYSCONFIGFILE;
    string log_file = "/var/log/diskprov.log";
    bool verbose = false;

    struct option long_options[] = {
	{ "layout", 1, 0, 'l' },
	{ "dry-run", 0, 0, 'n' },
	{ "workers", 1, 0, 'w' },
	{ "yes", 0, 0, 'y' },
	{ "keep-going", 0, 0, 'k' },
	{ "report", 1, 0, 'r' },
	{ "graph", 1, 0, 'g' },
	{ "config", 1, 0, 'c' },
	{ "logfile", 1, 0, OPT_LOGFILE },
	{ "verbose", 0, 0, 'v' },
	{ "help", 0, 0, 'h' },
	{ 0, 0, 0, 0 }
    };

    while (true)
    {
	int c = getopt_long(argc, argv, "l:nw:ykr:g:c:vh", long_options, 0);
	if (c == -1)
	    break;

	switch (c)
	{
	    case 'l':
		layout_file = optarg;
		break;

	    case 'n':
		dry_run = true;
		break;

	    case 'w':
		workers = optarg;
		break;

	    case 'y':
		yes = true;
		break;

	    case 'k':
		keep_going = true;
		break;

	    case 'r':
		report_file = optarg;
		break;

	    case 'g':
		graph_file = optarg;
		break;

	    case 'c':
		config_file = optarg;
		break;

	    case OPT_LOGFILE:
		log_file = optarg;
		break;

	    case 'v':
		verbose = true;
		break;

	    case 'h':
		help();

	    default:
		usage();
	}
    }

    if (optind >= argc || strcmp(argv[optind], "apply") != 0)
    {
	cerr << program_name << ": missing command 'apply'" << endl;
	usage();
    }

    if (optind + 1 < argc)
    {
	cerr << program_name << ": unrecognized argument '" << argv[optind + 1] << "'" << endl;
	usage();
    }

    if (layout_file.empty())
    {
	cerr << program_name << ": option --layout is required" << endl;
	usage();
    }

    Environment env;
    env.readSysconfig(config_file);

    if (!workers.empty())
    {
	if (workers.find_first_not_of("0123456789") != string::npos || !(workers >> env.workers) ||
	    env.workers == 0)
	{
	    cerr << program_name << ": invalid number of workers '" << workers << "'" << endl;
	    usage();
	}

	// an explicit number of workers is not capped
	env.max_workers = 0;
    }

    if (keep_going)
	env.stop_on_any_failure = false;

    if (verbose)
	env.log_level = "debug";

    string::size_type pos = log_file.rfind('/');
    if (pos == string::npos)
	createLogger("diskprov", ".", log_file, env.log_level);
    else
	createLogger("diskprov", log_file.substr(0, pos), log_file.substr(pos + 1), env.log_level);

    y2mil("diskprov apply layout:" << layout_file << " dry-run:" << dry_run);

    Layout layout;
    SystemCmdRunner runner(env.destructive_timeout, env.timeout);
    Orchestrator tmp(runner, env);
    Plan plan;

    try
    {
	layout = readLayout(layout_file);
	plan = tmp.plan(layout);
    }
    catch (const Exception& e)
    {
	DP_CAUGHT(e);
	cerr << program_name << ": " << e.msg() << endl;
	exit(EXIT_INVALID);
    }

    cout << plan;

    if (!graph_file.empty())
    {
	if (savePlanGraph(plan, graph_file))
	    cout << "run \"dot -T png -o plan.png " << graph_file << "\" to generate a png" << endl;
	else
	    cerr << program_name << ": saving graph to " << graph_file << " failed" << endl;
    }

    if (dry_run)
	exit(EXIT_COMPLETED);

    if (!yes && !confirm(plan))
    {
	cout << "aborted" << endl;
	exit(EXIT_DECLINED);
    }

    orchestrator.store(&tmp);
    install_signal_handlers();

    RunReport report = tmp.run(layout);

    orchestrator.store(nullptr);

    cout << report;

    if (!report_file.empty() && !report.save(report_file))
	cerr << program_name << ": saving report to " << report_file << " failed" << endl;

    if (report.getState() == COMPLETED)
	exit(EXIT_COMPLETED);

    switch (report.getError())
    {
	case ERR_INVALID_LAYOUT:
	case ERR_PARSE:
	case ERR_PLANNING:
	case ERR_UNSUPPORTED_OPERATION:
	    exit(EXIT_INVALID);

	default:
	    exit(EXIT_HALTED);
    }
}
