//
// logsum - Numerically stable log-space sums
// Copyright (c) 2009-2018 Illumina, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.
//
//

///
/// \author Chris Saunders
///

#include "LogSumExpOptionsParser.hh"

#include "common/ProgramUtil.hh"
#include "logsum_util/log.hh"

#include "boost/filesystem.hpp"


namespace po = boost::program_options;



static
void
usage(
    std::ostream& os,
    const logsum::Program& prog,
    const po::options_description& visible,
    const char* msg = nullptr)
{
    usage(os, prog, visible,
          "numerically stable log-sum-exp of whitespace separated log-space values, including inf, -inf and nan",
          " [input_file [input_file...]]\n\nInput is read from stdin if no input files are given, or for the input file '-'",
          msg);
}



po::options_description
getLogSumExpOptionsParser(
    LogSumExpOptions& opt)
{
    po::options_description req("configuration");
    req.add_options()
    ("input", po::value(&opt.inputFilenames),
     "Input file of log-space values (may be specified multiple times, '-' is stdin)")
    ("precision", po::value(&opt.precisionLabel)->default_value(opt.precisionLabel),
     "Floating point precision used to parse and sum values {float,double}")
    ("mode", po::value(&opt.modeLabel)->default_value(opt.modeLabel),
     "Reduction to report: 'sum' is log(sum_i exp(x_i)), 'mean' is log((1/n) sum_i exp(x_i)), "
     "'pairwise' is log(exp(a)+exp(b)) for each consecutive pair of values {sum,mean,pairwise}")
    ("per-file", po::value(&opt.isPerInputReport)->zero_tokens(),
     "Report the result for each input file in addition to the result for all inputs")
    ;

    po::options_description help("help");
    help.add_options()
    ("help,h","print this message");

    po::options_description visible("options");
    visible.add(req).add(help);
    return visible;
}



bool
finalizeLogSumExpOptions(
    const po::variables_map& /*vm*/,
    LogSumExpOptions& opt,
    std::string& errorMsg)
{
    errorMsg.clear();

    {
        bool isFound(false);
        for (unsigned i(0); i<FLOAT_PRECISION::SIZE; ++i)
        {
            if (opt.precisionLabel != FLOAT_PRECISION::label(i)) continue;
            opt.precision = static_cast<FLOAT_PRECISION::index_t>(i);
            isFound = true;
        }
        if (! isFound)
        {
            errorMsg = "Unknown precision: '" + opt.precisionLabel + "'";
            return true;
        }
    }

    {
        bool isFound(false);
        for (unsigned i(0); i<LOG_SUM_MODE::SIZE; ++i)
        {
            if (opt.modeLabel != LOG_SUM_MODE::label(i)) continue;
            opt.mode = static_cast<LOG_SUM_MODE::index_t>(i);
            isFound = true;
        }
        if (! isFound)
        {
            errorMsg = "Unknown mode: '" + opt.modeLabel + "'";
            return true;
        }
    }

    if (opt.isPerInputReport && (opt.mode == LOG_SUM_MODE::PAIRWISE))
    {
        errorMsg = "'per-file' option does not apply to pairwise mode";
        return true;
    }

    if (opt.inputFilenames.empty())
    {
        opt.inputFilenames.push_back("-");
    }

    for (const std::string& inputFilename : opt.inputFilenames)
    {
        if (inputFilename == "-") continue;
        if (! boost::filesystem::exists(inputFilename))
        {
            errorMsg = "Input file does not exist: '" + inputFilename + "'";
            return true;
        }
    }

    return false;
}



void
parseLogSumExpOptions(
    const logsum::Program& prog,
    int argc, char* argv[],
    LogSumExpOptions& opt)
{
    for (int i(0); i<argc; ++i)
    {
        if (i) opt.cmdline += ' ';
        opt.cmdline += argv[i];
    }

    po::options_description visible(getLogSumExpOptionsParser(opt));
    po::positional_options_description positional;
    positional.add("input", -1);

    bool po_parse_fail(false);
    po::variables_map vm;
    try
    {
        po::store(po::command_line_parser(argc,argv).options(visible).positional(positional).run(), vm);
        po::notify(vm);
    }
    catch (const po::error& e)
    {
        log_os << "\nERROR: Exception thrown by option parser: " << e.what() << "\n";
        po_parse_fail=true;
    }

    if (po_parse_fail)
    {
        usage(log_os,prog,visible,"Invalid command-line options");
    }

    if (vm.count("help"))
    {
        usage(log_os,prog,visible);
    }

    std::string errorMsg;
    if (finalizeLogSumExpOptions(vm,opt,errorMsg))
    {
        usage(log_os,prog,visible,errorMsg.c_str());
    }
}
