#include "shread/args.hpp"
#include "shread/decoder.hpp"
#include "shread/number_parse.hpp"

#include <getopt.h>

namespace shread {

namespace {

enum LongOnly { OPT_CONFIG = 256, OPT_INPUT, OPT_JSON, OPT_VERBOSE };

const char* const SHORT_OPTIONS = ":ac:d:fghiLln:p:sStuxzP:UR:";

const struct option LONG_OPTIONS[] = {
  {"array",        no_argument,       nullptr, 'a'},
  {"command",      required_argument, nullptr, 'c'},
  {"delimiter",    required_argument, nullptr, 'd'},
  {"export",       no_argument,       nullptr, 'x'},
  {"function",     no_argument,       nullptr, 'f'},
  {"global",       no_argument,       nullptr, 'g'},
  {"help",         no_argument,       nullptr, 'h'},
  {"line",         no_argument,       nullptr, 'L'},
  {"list",         no_argument,       nullptr, 'a'},
  {"local",        no_argument,       nullptr, 'l'},
  {"nchars",       required_argument, nullptr, 'n'},
  {"null",         no_argument,       nullptr, 'z'},
  {"prompt",       required_argument, nullptr, 'p'},
  {"prompt-str",   required_argument, nullptr, 'P'},
  {"right-prompt", required_argument, nullptr, 'R'},
  {"shell",        no_argument,       nullptr, 'S'},
  {"silent",       no_argument,       nullptr, 's'},
  {"tokenize",     no_argument,       nullptr, 't'},
  {"unexport",     no_argument,       nullptr, 'u'},
  {"universal",    no_argument,       nullptr, 'U'},
  {"config",       required_argument, nullptr, OPT_CONFIG},
  {"input",        required_argument, nullptr, OPT_INPUT},
  {"json",         no_argument,       nullptr, OPT_JSON},
  {"verbose",      no_argument,       nullptr, OPT_VERBOSE},
  {nullptr, 0, nullptr, 0},
};

bool fail(std::string* err, std::string msg) {
  if (err) *err = std::move(msg);
  return false;
}

}

bool parse_args(int argc, char** argv, CliOptions& opts, std::string* err) {
  ReadConfig& r = opts.read;
  optind = 0; // full rescan, also resets getopt's internal state
  opterr = 0;

  int c;
  while ((c = getopt_long(argc, argv, SHORT_OPTIONS, LONG_OPTIONS, nullptr)) != -1) {
    switch (c) {
      case 'a': r.array = true; break;
      case 'c': r.commandline = str2text(optarg); break;
      case 'd': r.delimiter = str2text(optarg); break;
      case 'f': r.place |= env_mode::FUNCTION; break;
      case 'g': r.place |= env_mode::GLOBAL; break;
      case 'h': r.print_help = true; break;
      case 'i':
        return fail(err, "usage of -i for --silent is deprecated. Please use -s or --silent instead.");
      case 'L': r.one_line = true; break;
      case 'l': r.place |= env_mode::LOCAL; break;
      case 'n': {
        NumberError why = NumberError::None;
        auto n = parse_count(optarg, &why);
        if (!n) {
          if (why == NumberError::OutOfRange)
            return fail(err, std::string("Argument '") + optarg + "' is out of range");
          return fail(err, std::string(optarg) + ": invalid integer");
        }
        r.nchars = static_cast<std::size_t>(*n);
        break;
      }
      case 'P': r.prompt_str = str2text(optarg); break;
      case 'p': r.prompt = str2text(optarg); break;
      case 'R': r.right_prompt = str2text(optarg); break;
      case 's': r.silent = true; break;
      case 'S': r.shell = true; break;
      case 't': r.tokenize = true; break;
      case 'U': r.place |= env_mode::UNIVERSAL; break;
      case 'u': r.place |= env_mode::UNEXPORT; break;
      case 'x': r.place |= env_mode::EXPORT; break;
      case 'z': r.split_null = true; break;
      case OPT_CONFIG:  opts.config_path = optarg; break;
      case OPT_INPUT:   opts.input_path = optarg; break;
      case OPT_JSON:    opts.json = true; break;
      case OPT_VERBOSE: opts.verbose = true; break;
      case ':':
        return fail(err, std::string(argv[optind - 1]) + ": option requires an argument");
      default:
        return fail(err, std::string(argv[optind - 1]) + ": unknown option");
    }
  }

  for (int i = optind; i < argc; ++i) r.vars.emplace_back(argv[i]);
  if (r.vars.empty()) r.to_stdout = true;
  return true;
}

void print_usage(std::ostream& os) {
  os <<
    "Usage: shread [OPTIONS] [VARIABLE ...]\n"
    "Read a line from standard input and split it into variables.\n"
    "\n"
    "  -a, --array, --list     store all fields in the single VARIABLE\n"
    "  -d, --delimiter=STR     split on STR instead of IFS (empty: per char)\n"
    "  -t, --tokenize          split with shell quoting rules\n"
    "  -L, --line              read one line per VARIABLE\n"
    "  -n, --nchars=N          stop after N characters\n"
    "  -z, --null              records end at NUL instead of newline\n"
    "  -p, --prompt=CMD        prompt command (interactive)\n"
    "  -P, --prompt-str=STR    literal prompt (interactive)\n"
    "  -R, --right-prompt=CMD  right prompt command (interactive)\n"
    "  -c, --command=STR       initial contents of the line (interactive)\n"
    "  -s, --silent            do not echo input (interactive)\n"
    "  -S, --shell             shell-syntax editing (interactive)\n"
    "  -l/-f/-g/-U             local/function/global/universal scope\n"
    "  -x, --export            export the variables\n"
    "  -u, --unexport          do not export the variables\n"
    "      --config=FILE       JSON settings (read_byte_limit, ifs, read_only)\n"
    "      --input=FILE        read FILE instead of standard input\n"
    "      --json              print the assignments as JSON\n"
    "      --verbose           log strategy and byte counts to stderr\n"
    "  -h, --help              show this help\n"
    "\n"
    "Without VARIABLE the record is written to standard output.\n"
    "Exit status: 0 ok, 1 no input, 2 bad arguments, 122 byte limit exceeded.\n"
    "Environment: SHREAD_READ_LIMIT overrides the byte limit (0 = none).\n";
}

}
