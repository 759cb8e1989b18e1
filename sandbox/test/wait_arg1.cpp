#include <unistd.h>

#include <cstdlib>

int main(int argc, char** argv) {
  usleep(atof(argv[1]) * 1000000);
  return 0;
}
