#include <bpg/decoder.hpp>
#include <bpg/encoder.hpp>
#include <bpg/graph.hpp>
#include <bpg/layout.hpp>
#include <bpg/vocabulary.hpp>

#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace {

  constexpr int exit_success = 0;
  constexpr int exit_usage = 1;
  constexpr int exit_io = 2;
  constexpr int exit_parse = 3;
  constexpr int exit_anomalies = 4;

  struct cli_options {
    std::string command;
    std::string input_file;
    std::string output_file;
    bool strict = false;
    bool compact = false;
  };

  // Everything a command needs once the input has been decoded.
  struct session {
    const cli_options& options;
    bpg::id_allocator ids;
    bpg::decode_result decoded;
  };

  using command_fn = int (*)(session&);

  struct command {
    std::string_view name;
    std::string_view summary;
    command_fn run;
  };

  void
  print_diagnostic(std::ostream& os, const bpg::diagnostic& d) {
    if (d.line != 0) { os << "line " << d.line << ": "; }
    os << d.message << "\n";
  }

  void
  print_warnings(const bpg::diagnostics& warnings) {
    for (const auto& w : warnings) {
      std::cerr << "bpg: warning: ";
      print_diagnostic(std::cerr, w);
    }
  }

  void
  print_size(std::ostream& os, const bpg::node& n) {
    auto size = bpg::shape_size(n);
    os << " at " << bpg::format_coordinate(n.position.x) << ','
       << bpg::format_coordinate(n.position.y) << " size "
       << bpg::format_coordinate(size.width) << 'x'
       << bpg::format_coordinate(size.height) << "\n";
  }

  int
  normalize(session& s) {
    bpg::encode_options encode_opts;
    if (s.options.compact) { encode_opts.indent = 0; }
    auto encoded = bpg::encode(s.decoded.graph, s.ids, encode_opts);
    print_warnings(encoded.warnings);

    if (s.options.output_file.empty()) {
      std::cout << encoded.document;
      return exit_success;
    }
    std::ofstream out(s.options.output_file, std::ios::binary);
    if (!(out << encoded.document)) {
      std::cerr << "bpg: cannot write file: " << s.options.output_file << "\n";
      return exit_io;
    }
    return exit_success;
  }

  int
  dump(session& s) {
    const auto& g = s.decoded.graph;
    for (const auto& n : g.nodes) {
      if (const auto* p = std::get_if<bpg::participant>(&n.kind)) {
        std::cout << "participant " << n.id << " \"" << bpg::display_name(n)
                  << "\" process=" << p->process_ref;
      } else if (n.holds<bpg::lane>()) {
        std::cout << "lane " << n.id << " \"" << bpg::display_name(n)
                  << "\" participant=" << n.participant_id;
      } else {
        std::cout << bpg::element_name(n.kind) << ' ' << n.id << " \""
                  << bpg::display_name(n) << "\"";
        if (!n.participant_id.empty()) {
          std::cout << " participant=" << n.participant_id;
        }
        if (!n.lane_id.empty()) { std::cout << " lane=" << n.lane_id; }
      }
      print_size(std::cout, n);
    }
    for (const auto& e : g.edges) {
      std::cout << (e.is_message_flow ? "messageFlow " : "sequenceFlow ")
                << e.id << ' ' << e.source << " -> " << e.target;
      if (!e.name.empty()) { std::cout << " \"" << e.name << "\""; }
      std::cout << "\n";
    }
    return exit_success;
  }

  // Lists every anomaly on stdout as file:line: kind: message.
  int
  check(session& s) {
    for (const auto& d : s.decoded.warnings) {
      std::cout << s.options.input_file << ':' << d.line << ": "
                << bpg::to_string(d.kind) << ": " << d.message << "\n";
    }
    return s.decoded.warnings.empty() ? exit_success : exit_anomalies;
  }

  constexpr command commands[] = {
      {"normalize", "Decode and re-encode a BPMN document", normalize},
      {"dump", "Print participants, lanes, nodes and flows", dump},
      {"check", "List document anomalies; exits 4 when there are any", check},
  };

  const command*
  find_command(std::string_view name) {
    for (const auto& c : commands) {
      if (c.name == name) { return &c; }
    }
    return nullptr;
  }

  void
  print_usage(std::ostream& os) {
    os << "Usage: bpg [options] <command> <file.bpmn>\n\nCommands:\n";
    for (const auto& c : commands) {
      os << "  " << c.name << std::string(12 - c.name.size(), ' ')
         << c.summary << "\n";
    }
    os << "\nOptions:\n"
       << "  -o <file>   Output file for normalize (default: stdout)\n"
       << "  --strict    Fail on the first document anomaly\n"
       << "  --compact   Write the document without indentation\n"
       << "  -h, --help  Show this help message\n"
       << "  --version   Show version information\n";
  }

  // Empty on a usage error, which has already been reported.
  std::optional<cli_options>
  parse_args(int argc, char* argv[]) {
    cli_options opts;
    for (int i = 1; i < argc; ++i) {
      std::string_view arg = argv[i];
      if (arg == "--strict") {
        opts.strict = true;
      } else if (arg == "--compact") {
        opts.compact = true;
      } else if (arg == "-o") {
        if (i + 1 >= argc) {
          std::cerr << "bpg: -o requires an argument\n";
          return std::nullopt;
        }
        opts.output_file = argv[++i];
      } else if (arg.size() > 1 && arg[0] == '-') {
        std::cerr << "bpg: unknown option: " << arg << "\n";
        return std::nullopt;
      } else if (opts.command.empty()) {
        opts.command = arg;
      } else if (opts.input_file.empty()) {
        opts.input_file = arg;
      } else {
        std::cerr << "bpg: unexpected argument: " << arg << "\n";
        return std::nullopt;
      }
    }
    return opts;
  }

  std::optional<std::string>
  read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) { return std::nullopt; }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
  }

} // namespace

int
main(int argc, char* argv[]) {
  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      print_usage(std::cerr);
      return exit_success;
    }
    if (arg == "--version") {
      std::cerr << "bpg " << BPG_VERSION << "\n";
      return exit_success;
    }
  }

  auto opts = parse_args(argc, argv);
  if (!opts) { return exit_usage; }
  if (opts->command.empty()) {
    std::cerr << "bpg: no command\n";
    print_usage(std::cerr);
    return exit_usage;
  }
  const auto* cmd = find_command(opts->command);
  if (cmd == nullptr) {
    std::cerr << "bpg: unknown command: " << opts->command << "\n";
    return exit_usage;
  }
  if (opts->input_file.empty()) {
    std::cerr << "bpg: no input file\n";
    print_usage(std::cerr);
    return exit_usage;
  }

  auto xml = read_file(opts->input_file);
  if (!xml) {
    std::cerr << "bpg: cannot open file: " << opts->input_file << "\n";
    return exit_io;
  }

  session s{*opts, {}, {}};
  bpg::decode_options decode_opts;
  decode_opts.policy =
      opts->strict ? bpg::decode_policy::strict : bpg::decode_policy::lenient;
  try {
    s.decoded = bpg::decode(*xml, s.ids, decode_opts);
  } catch (const bpg::malformed_document_error& e) {
    std::cerr << "bpg: " << opts->input_file << ": " << e.what() << "\n";
    return exit_parse;
  } catch (const bpg::document_anomaly_error& e) {
    std::cerr << "bpg: " << opts->input_file << ": ";
    print_diagnostic(std::cerr, e.get_diagnostic());
    return exit_parse;
  }
  if (cmd->run != check) { print_warnings(s.decoded.warnings); }
  return cmd->run(s);
}
