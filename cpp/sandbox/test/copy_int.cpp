#include <cstdio>

// Copies an integer from stdin to stdout, and its double to stderr.
int main() {
  int x = 0;
  if (scanf("%d", &x) != 1) return 1;  // NOLINT
  printf("%d\n", x);                   // NOLINT
  fprintf(stderr, "%d\n", 2 * x);      // NOLINT
  return 0;
}
