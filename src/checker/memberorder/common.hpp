#ifndef MEMBERORDER_COMMON_HPP
#define MEMBERORDER_COMMON_HPP 1

// External headers that are used in many places

#include <llvm/ADT/ArrayRef.h>
#include <llvm/ADT/Optional.h>
#include <llvm/ADT/SmallVector.h>
#include <llvm/ADT/StringRef.h>
#include <ostream>
#include <algorithm>

using llvm::ArrayRef;
using llvm::Optional;
using llvm::SmallVector;
using llvm::StringRef;

#endif
