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

#ifndef SITEDEPLOY_DEPLOYMENT_REQUEST_HH
#define SITEDEPLOY_DEPLOYMENT_REQUEST_HH

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "utils/Enum.hh"

namespace sitedeploy
{
  struct ArtifactRef
  {
    std::string name;
    std::string url;
    std::string checksum;
  };

  struct Person
  {
    std::string name;
    std::string email;
    std::string username;
  };

  // A fully validated request to publish one commit to one deployment target.
  struct DeploymentRequest
  {
    std::string repository;
    std::string environment;
    std::int64_t deployment_id{0};
    std::string commit_sha;
    ArtifactRef artifact;
    std::string deploy_url;
    std::filesystem::path webroot;
    std::optional<Person> pusher;
    std::vector<Person> authors;
    std::vector<std::string> log_recipients;
  };

  // A well-formed event that requires no action.
  struct IgnoredEvent
  {
    std::string reason;
  };

  enum class DeploymentState
  {
    Queued,
    InProgress,
    Success,
    Failure,
  };
} // namespace sitedeploy

template<>
struct sitedeploy::utils::enum_traits<sitedeploy::DeploymentState>
{
  static constexpr std::array<std::pair<std::string_view, sitedeploy::DeploymentState>, 4> names{
    {{"queued", sitedeploy::DeploymentState::Queued},
     {"in_progress", sitedeploy::DeploymentState::InProgress},
     {"success", sitedeploy::DeploymentState::Success},
     {"failure", sitedeploy::DeploymentState::Failure}}};
};

#endif // SITEDEPLOY_DEPLOYMENT_REQUEST_HH
