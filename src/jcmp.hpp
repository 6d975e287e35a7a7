#pragma once

// Structural JSON comparison: full diff, path-equality and path-vs-literal checks.
//
//   auto left = jcmp::Document::parse(R"({"name":"John","age":30})", "left");
//   auto right = jcmp::Document::parse(R"({"name":"John","age":31})", "right");
//   jcmp::DiffResult r = jcmp::Comparator::compare_full(left, right); // age: value differs: 30 vs 31
//   auto same = jcmp::Comparator::compare_at_path(left, right, "name"); // same.value() == true

#include "Comparator.hpp"
#include "DiffReport.hpp"
#include "Differ.hpp"
#include "Document.hpp"
#include "JCmpError.hpp"
#include "Path.hpp"
#include "PathEvaluator.hpp"
#include "PathParser.hpp"
