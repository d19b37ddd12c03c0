#include "codebox/cli/app.hpp"

int main(int argc, char* argv[]) {
  return codebox::cli::run_app(argc, const_cast<char const**>(argv));
}
