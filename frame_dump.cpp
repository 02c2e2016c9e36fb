#include <array>
#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/program_options.hpp>

#include <cursor.hpp>
#include <frames.hpp>
#include <io.hpp>
#include <size_dispatch.hpp>

using SyncWidths     = pullmatch::utils::size_list<1, 2, 4, 8>;
using PayloadLengths = pullmatch::utils::size_list<1, 2, 4, 8, 16, 32, 64, 128, 256>;

class invoke {
private:
  std::string input;
  std::vector<std::uint8_t> sync;
  std::size_t max_frames;
  bool quiet;

public:
  invoke(std::string input, std::vector<std::uint8_t> sync, std::size_t max_frames, bool quiet)
    : input(input), sync(sync), max_frames(max_frames), quiet(quiet)
  { }

  template <std::size_t S, std::size_t L>
  void call()
  {
    std::array<std::uint8_t, S> marker;
    std::copy(sync.begin(), sync.end(), marker.begin());

    std::ifstream file;
    pullmatch::io::open_file(file, input.c_str());
    auto c = pullmatch::make_stream_cursor<std::uint8_t>(file);

    bool print = !quiet;
    auto stats = pullmatch::scan_frames<L>(c, marker,
      [print](std::size_t offset, const std::array<std::uint8_t, L> &payload, std::uint8_t checksum) {
        if (print) {
          std::cout << offset << "\t"
                    << pullmatch::io::to_hex(payload) << "\t"
                    << pullmatch::io::to_hex(std::array<std::uint8_t, 1> {{ checksum }})
                    << "\n";
        }
      }, max_frames);

    std::cout << "=== Frames:          " << stats.frames << "\n"
              << "=== Resyncs:         " << stats.resyncs << "\n"
              << "=== Truncated:       " << stats.truncated << "\n"
              << "=== Bytes consumed:  " << c.count() << std::endl;
  }
};

int main(int argc, char **argv)
{
  using std::string;
  using pullmatch::utils::choices;
  using pullmatch::utils::allow;
  namespace po = boost::program_options;
  po::options_description desc;
  po::variables_map vm;
  try {
    desc.add_options()
        ("input-file,i", po::value<string>()->required(),
         "Binary file to scan.")
        ("sync,s", po::value<string>()->required(),
         ("Sync marker, as hex. Widths (bytes): " + choices<SyncWidths>()).c_str())
        ("payload-length,l", po::value<std::size_t>()->default_value(16U),
         ("Payload bytes after each marker. Choices: " + choices<PayloadLengths>()).c_str())
        ("max-frames,n", po::value<std::size_t>()->default_value(0U),
         "Stop after this many frames (0: no limit).")
        ("quiet,q", "Only print the summary.");

    po::positional_options_description pd;
    pd.add("input-file", 1).add("sync", 1).add("payload-length", 1);

    try {
      po::store(po::command_line_parser(argc, argv).options(desc).positional(pd).run(), vm);
      po::notify(vm);
    } catch (boost::program_options::error &e) {
      throw std::runtime_error(e.what());
    }

    // Collect parameters
    string infile   = vm["input-file"].as<string>();
    auto sync       = pullmatch::io::parse_hex(vm["sync"].as<string>());
    std::size_t length = vm["payload-length"].as<std::size_t>();

    // Check
    if (!allow<SyncWidths>(sync.size())) {
      throw std::logic_error(std::to_string(sync.size()) + " bytes is not a valid sync width.");
    }
    if (!allow<PayloadLengths>(length)) {
      throw std::logic_error(std::to_string(length) + " is not a valid payload length.");
    }

    std::cout << "--- Input:          " << infile << "\n"
              << "--- Sync:           " << pullmatch::io::to_hex(sync) << "\n"
              << "--- Payload length: " << length << "\n"
              << "--- Max frames:     " << vm["max-frames"].as<std::size_t>() << std::endl;

    invoke ivk(infile, sync, vm["max-frames"].as<std::size_t>(), vm.count("quiet") > 0);
    pullmatch::utils::dispatch<SyncWidths, PayloadLengths>(sync.size(), length, ivk);

  } catch (std::exception &e) {
    std::cerr << e.what() << "\n"
              << "Command-line options:"  << "\n"
              << desc << std::endl;
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
