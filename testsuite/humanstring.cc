

#include <iostream>

#include "common.h"

#include "diskprov/Region.h"
#include "diskprov/Utils/HumanString.h"


using namespace std;
using namespace diskprov;


unsigned long long
bytes(const string& str)
{
    unsigned long long size = 0;
    check(humanStringToByte(str, size));
    return size;
}


void
parse()
{
    check(bytes("4096") == 4096);
    check(bytes("512 B") == 512);
    check(bytes("1 MiB") == 1024 * 1024);
    check(bytes("512MiB") == 512 * 1024 * 1024);
    check(bytes("1.5 GiB") == 1536ULL * 1024 * 1024);
    check(bytes("200 GiB") == 200ULL * 1024 * 1024 * 1024);
    check(bytes("2 K") == 2048);

    // parted style decimal units
    check(bytes("100GB") == 100000000000ULL);
    check(bytes("140 GB") == 140000000000ULL);
    check(bytes("1kB") == 1000);

    unsigned long long size = 0;
    check(!humanStringToByte("", size));
    check(!humanStringToByte("MiB", size));
    check(!humanStringToByte("12 apples", size));
    check(!humanStringToByte("-1 MiB", size));

    // beyond 64 bit
    check(!humanStringToByte("20 EiB", size));
    check(!humanStringToByte("18446744073709551616", size));
    check(!humanStringToByte("1e300 TB", size));
    check(bytes("15 EiB") == 15ULL * 1024 * 1024 * 1024 * 1024 * 1024 * 1024);
}


void
format()
{
    check(byteToHumanString(0) == "0 B");
    check(byteToHumanString(1024) == "1 KiB");
    check(byteToHumanString(512 * 1024 * 1024) == "512 MiB");
    check(byteToHumanString(1536ULL * 1024 * 1024) == "1.50 GiB");
    check(byteToHumanString(1536ULL * 1024 * 1024, 1) == "1.5 GiB");
}


void
region()
{
    Region a(0, 100);
    Region b(50, 100);
    Region c(100, 10);
    Region empty(10, 0);

    check(a.end() == 99);
    check(a.doIntersect(b));
    check(b.doIntersect(a));
    check(!a.doIntersect(c));
    check(!a.doIntersect(empty));

    Region overlap = a.intersect(b);
    check(overlap.start() == 50 && overlap.len() == 50);
    check(a.intersect(c).empty());
}


int
main()
{
    setup_logger();

    parse();
    format();
    region();

    cout << "humanstring ok" << endl;
}
