#include "toolwatch/ToolInference.h"

#include <stdio.h>

namespace inference {

static bool isBinary(int v) { return v == 0 || v == 1; }

bool parseBayIndex(const char* label, int& out_index) {
  if (!label || label[0] != 't' || label[1] == '\0') return false;
  // Only the canonical spelling: inference reads bays back as "t%d"
  if (label[1] == '0' && label[2] != '\0') return false;

  int idx = 0;
  for (const char* p = label + 1; *p; ++p) {
    if (*p < '0' || *p > '9') return false;
    idx = idx * 10 + (*p - '0');
    if (idx > MAX_BAY_INDEX) return false;
  }

  out_index = idx;
  return true;
}

int toolCount(const char* const* labels, uint8_t count) {
  int max_idx = -1;
  for (uint8_t i = 0; i < count; ++i) {
    int idx = 0;
    if (parseBayIndex(labels[i], idx) && idx > max_idx) max_idx = idx;
  }
  return max_idx + 1;
}

Result computeCurrentTool(const SensorStateStore& snapshot, int tool_count) {
  Result r;
  r.diag.tool_count = tool_count;

  if (tool_count < 1) {
    r.diag.invalid = true;
    return r;   // UNKNOWN
  }

  r.diag.has_counts = true;

  const int ex = snapshot.value(ENGAGED_LABEL, 0);
  r.diag.engaged = ex;
  bool bad = !isBinary(ex);

  int sum = 0;
  int empties = 0;
  int empty_idx = -1;

  char label[SensorStateStore::MAX_LABEL_LEN + 1];
  for (int i = 0; i < tool_count; ++i) {
    snprintf(label, sizeof(label), "t%d", i);
    const int occ = snapshot.value(label, 0);
    if (!isBinary(occ)) bad = true;

    sum += occ;
    if (occ == 0) {
      empties++;
      empty_idx = i;
    }
  }

  r.diag.occupied_sum = sum;
  r.diag.empties = empties;
  r.diag.empty_idx = empty_idx;
  r.diag.invalid = bad;

  if (bad) {
    r.tool = InferredTool::unknown();
  } else if (ex == 0 && sum == tool_count) {
    r.tool = InferredTool::unmounted();
  } else if (ex == 1 && sum == tool_count - 1 && empties == 1) {
    r.tool = InferredTool::mounted(empty_idx);
  } else {
    r.tool = InferredTool::unknown();
  }

  return r;
}

}  // namespace inference
