#include <stdlib.h>
#include <ctime>
#include <vector>

// Burns argv[1] seconds of CPU time.
int main(int argc, char** argv) {
  const constexpr int sz = 10240;
  std::clock_t start = std::clock();
  std::vector<int> v(sz, 0);
  int i = 0;
  while ((std::clock() - start) < atof(argv[1]) * CLOCKS_PER_SEC) {
    for (int j = 0; j < i; j++) {
      v[j] += i;
    }
    i = (i + 1) % sz;
  }
  return v[0] == -1;
}
