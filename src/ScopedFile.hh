// Copyright (C) 2026 The sitedeploy authors
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.

#ifndef SCOPED_FILE_HH
#define SCOPED_FILE_HH

#include <filesystem>
#include <system_error>
#include <utility>

// Removes the file at `path` when it goes out of scope.
class ScopedFile
{
public:
  explicit ScopedFile(std::filesystem::path path)
    : path(std::move(path))
  {
  }

  ~ScopedFile()
  {
    std::error_code ec;
    std::filesystem::remove(path, ec);
  }

  ScopedFile(const ScopedFile &) = delete;
  ScopedFile &operator=(const ScopedFile &) = delete;
  ScopedFile(ScopedFile &&) = delete;
  ScopedFile &operator=(ScopedFile &&) = delete;

  const std::filesystem::path &get_path() const
  {
    return path;
  }

private:
  std::filesystem::path path;
};

#endif // SCOPED_FILE_HH
