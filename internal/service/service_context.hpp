#pragma once

#include <cstddef>
#include <memory>

namespace demonlist::db { class Repository; }
namespace demonlist::auth { class PasswordHasher; class TokenCodec; }
namespace demonlist::video { class VideoValidator; }

namespace demonlist::service {

/*
  Dependency container shared by every worker.
*/
struct ServiceContext {
  std::shared_ptr<demonlist::db::Repository>      repository;
  std::shared_ptr<demonlist::auth::PasswordHasher> password_hasher;
  std::shared_ptr<demonlist::auth::TokenCodec>     token_codec;
  std::shared_ptr<demonlist::video::VideoValidator> video_validator;

  // positions 1..list_size form the main list, up to extended_list_size the extended list
  int list_size          = 75;
  int extended_list_size = 150;

  std::size_t default_page_limit = 50;
  std::size_t max_page_limit     = 100;
};

} // namespace demonlist::service
