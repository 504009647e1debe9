/*
	Copyright (c) 2009 by Chad Nelson
		      2015 by Darcy Shen
	Released under the MIT License.
	See the provided LICENSE.TXT file for details.
*/

#include "mdast.h"

#include <fstream>
#include <iostream>

#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>

namespace po=boost::program_options;

namespace {

void listFormats(std::ostream& out) {
    out << "readers:";
    std::vector<std::string> names=mdast::Converter::readers();
    for (auto i=names.cbegin(), ie=names.cend(); i!=ie; ++i) out << ' ' << *i;
    out << "\nwriters:";
    names=mdast::Converter::writers();
    for (auto i=names.cbegin(), ie=names.cend(); i!=ie; ++i) out << ' ' << *i;
    out << '\n';
}

} // namespace

int main(int argc, char *argv[]) {
    po::options_description visible("Usage: mdconv [options] [input]\nOptions");
    visible.add_options()
        ("help,h", "show this message")
        ("from,f", po::value<std::string>()->default_value("markdown"), "input format")
        ("to,t", po::value<std::string>()->default_value("html"), "output format")
        ("output,o", po::value<std::string>(), "output file (default: standard output)")
        ("standalone,s", "write a complete document")
        ("fragment", "write only the body, even for LaTeX")
        ("no-tables", "don't recognize pipe tables")
        ("no-strikethrough", "don't recognize ~strikethrough~")
        ("no-autolinks", "don't recognize <scheme:...> and <user@host> links")
        ("list-formats", "list the reader and writer names")
        ("verbose,v", "log what the parser does");

    po::options_description hidden;
    hidden.add_options()("input", po::value<std::string>(), "input file");

    po::options_description all;
    all.add(visible).add(hidden);

    po::positional_options_description positional;
    positional.add("input", 1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).options(all)
                  .positional(positional).run(), vm);
        po::notify(vm);
    } catch (po::error& e) {
        spdlog::error("{}", e.what());
        std::cerr << visible;
        return 1;
    }

    if (vm.count("help")) {
        std::cout << visible;
        return 0;
    }
    if (vm.count("list-formats")) {
        listFormats(std::cout);
        return 0;
    }

    spdlog::set_level(vm.count("verbose") ? spdlog::level::debug : spdlog::level::warn);

    const std::string from=vm["from"].as<std::string>(), to=vm["to"].as<std::string>();

    mdast::ReaderOptions readerOptions;
    readerOptions.tables=!vm.count("no-tables");
    readerOptions.strikethrough=!vm.count("no-strikethrough");
    readerOptions.autolinks=!vm.count("no-autolinks");

    mdast::WriterOptions writerOptions(vm.count("standalone")
        || (to=="latex" && !vm.count("fragment")));

    try {
        mdast::Converter converter(from, to, readerOptions, writerOptions);

        mdast::Document doc;
        if (vm.count("input")) {
            const std::string path=vm["input"].as<std::string>();
            std::ifstream in(path.c_str(), std::ios_base::binary);
            if (!in) {
                spdlog::error("cannot open {}", path);
                return 1;
            }
            doc=converter.read(in);
        } else {
            doc=converter.read(std::cin);
        }

        if (vm.count("output")) {
            const std::string path=vm["output"].as<std::string>();
            std::ofstream out(path.c_str(), std::ios_base::binary);
            if (!out) {
                spdlog::error("cannot write {}", path);
                return 1;
            }
            converter.write(doc, out);
        } else {
            converter.write(doc, std::cout);
        }
    } catch (mdast::Error& e) {
        spdlog::error("{}", e.what());
        return 1;
    }
    return 0;
}
