#pragma once

#define VIREO_DELETE_COPY(ClassName)               \
  ClassName(const ClassName&)            = delete; \
  ClassName& operator=(const ClassName&) = delete;

#define VIREO_DEFAULT_MOVE(ClassName)          \
  ClassName(ClassName&&)            = default; \
  ClassName& operator=(ClassName&&) = default;
