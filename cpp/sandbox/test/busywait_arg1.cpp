#include <ctime>
#include <cstdlib>

// Spins for argv[1] seconds of CPU time.
int main(int argc, char** argv) {
  if (argc < 2) return 1;
  const std::clock_t budget = atof(argv[1]) * CLOCKS_PER_SEC;
  const std::clock_t start = std::clock();
  volatile unsigned long counter = 0;
  while (std::clock() - start < budget) counter++;
  return 0;
}
