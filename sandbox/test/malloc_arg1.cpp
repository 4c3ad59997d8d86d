#include <stdlib.h>
#include <string.h>

// Allocates and touches argv[1] MiB, so that they count as resident.
int main(int argc, char** argv) {
  const size_t size = atoi(argv[1]) * 1024 * 1024LL;
  char* data = static_cast<char*>(malloc(size));
  if (data == nullptr) return 1;
  memset(data, 1, size);
  int sum = 0;
  for (size_t i = 0; i < size; i += 4096) sum += data[i];
  free(data);
  return sum == 0;
}
