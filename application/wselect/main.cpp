#include <wselect/app.hpp>

int main(int argc, char **argv) { return wselect::App{}.run(argc, argv); }
