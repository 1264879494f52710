// DNS query load generator (C++23)

#include <exception>
#include <string>

#include "qf/cli.hpp"
#include "qf/console.hpp"
#include "qf/domains.hpp"
#include "qf/options.hpp"
#include "qf/output.hpp"
#include "qf/runner.hpp"

int main(int argc, char **argv)
{
    qf::Options opt;
    if (argc <= 1)
    {
        qf::print_usage(argv[0]);
        return 0;
    }
    if (!qf::parse_args(argc, argv, opt)) return 1;

    try
    {
        const qf::DomainPool pool = qf::load_domains(opt.domains);
        if (opt.debug >= 1) qf::console_println(qf::format_header_text(opt, pool.size()));

        qf::run_load(opt, pool, [](const std::string &line) { qf::console_println(line); });
    }
    catch (const std::exception &e)
    {
        qf::console_eprintln(std::string("error: ") + e.what());
        return 1;
    }
    return 0;
}
