#include <fstream>
#include <iostream>
#include <iterator>
#include <string>

#include <QByteArray>

#include "draw_service.hpp"

static void usage() {
  std::cerr << "Usage:\n"
               "  draw-json [request.json]\n"
               "\n"
               "Reads a draw request (or an array of them) from the file, or "
               "from stdin\n"
               "when no file is given, and writes the response JSON to "
               "stdout.\n"
               "Exit status 2 when any request is rejected.\n"
               "\n"
               "Environment:\n"
               "  RASTERLAB_MAX_COORD  largest accepted |coordinate| (default "
               "100000)\n"
               "  RASTERLAB_THREADS    workers for request arrays (default: "
               "all cores)\n";
}

int main(int argc, char **argv) {
  if (argc > 2 || (argc == 2 && (std::string(argv[1]) == "-h" ||
                                 std::string(argv[1]) == "--help"))) {
    usage();
    return 1;
  }

  std::string body;
  if (argc == 2) {
    std::ifstream is(argv[1], std::ios::binary);
    if (!is) {
      std::cerr << "Failed to open " << argv[1] << "\n";
      return 3;
    }
    body.assign(std::istreambuf_iterator<char>(is),
                std::istreambuf_iterator<char>());
  } else {
    body.assign(std::istreambuf_iterator<char>(std::cin),
                std::istreambuf_iterator<char>());
  }

  const DrawService service(DrawServiceConfig::fromEnvironment());
  bool ok = true;
  const QByteArray out =
      service.handleJson(QByteArray::fromStdString(body), &ok);
  std::cout.write(out.constData(), out.size());
  std::cout << "\n";
  if (!std::cout) {
    std::cerr << "Failed to write response\n";
    return 3;
  }
  return ok ? 0 : 2;
}
