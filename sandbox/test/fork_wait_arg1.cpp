#include <unistd.h>

#include <cstdio>
#include <cstdlib>
#include <cstring>

// Forks a child that sleeps for argv[1] seconds and prints its pid. The parent
// waits as well, unless argv[2] is "exit".
int main(int argc, char** argv) {
  pid_t pid = fork();
  if (pid == -1) return 1;
  if (pid == 0) {
    usleep(atof(argv[1]) * 1000000);
    return 0;
  }
  printf("%d\n", pid);
  fflush(stdout);
  if (argc > 2 && strcmp(argv[2], "exit") == 0) return 0;
  usleep(atof(argv[1]) * 1000000);
  return 0;
}
