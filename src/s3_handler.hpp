#pragma once

#include "disposition_engine.hpp"
#include "object_lister.hpp"
#include "object_store.hpp"
#include "remote_handler.hpp"
#include "transfer_executor.hpp"

#include <memory>

namespace objxfer {

// Transfer endpoint backed by an S3 compatible bucket
class s3_handler : public remote_handler {
  const transfer_spec _spec;
  logger _log;
  std::unique_ptr<object_store> _store;
  object_lister _lister;
  transfer_executor _executor;
  disposition_engine _disposition;
  bool _tidy = false;

 public:
  // Connects to the store described by the transfer spec. Credentials,
  // region and endpoint missing from the transfer spec are taken from the
  // environment.
  s3_handler(const transfer_spec& spec, const logger& log);

  // Uses the given client
  s3_handler(const transfer_spec& spec, std::unique_ptr<object_store> store, const logger& log);

  ~s3_handler() override;

  s3_handler(const s3_handler&) = delete;
  s3_handler& operator=(const s3_handler&) = delete;

  backend_type type() const override { return backend_type::s3; }
  bool supports_native_copy(const remote_handler& destination) const override;

  list_result list_files(const std::string& directory = "", const std::string& pattern = "") override;
  int push_files_from_worker(const std::filesystem::path& staging_dir) override;
  int pull_files_to_worker(const std::vector<std::string>& files, const std::filesystem::path& staging_dir) override;
  int transfer_files(const std::vector<std::string>& files, remote_handler& destination) override;
  int handle_post_copy_action(const std::vector<std::string>& files) override;
  int move_files_to_final_location(const std::vector<std::string>& files) override;
  void tidy() override;

  const transfer_spec& spec() const override { return _spec; }

 private:
  void check_open() const;
};

}  // namespace objxfer
