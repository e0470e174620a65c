#include <devsup/app.hpp>

int main(int argc, char **argv) { return devsup::App{}.run(argc, argv); }
