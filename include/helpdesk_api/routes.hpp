#pragma once
#include <memory>
#include <nlohmann/json.hpp>

#include "server.hpp"

namespace helpdesk_core {
class RetrievalPipeline;
class TaskQueueRepo;
}  // namespace helpdesk_core

namespace helpdesk_api {

class Routes {
 public:
  Routes(std::shared_ptr<helpdesk_core::RetrievalPipeline> pipeline,
         std::shared_ptr<helpdesk_core::TaskQueueRepo> task_queue_repo);
  ~Routes() = default;

  Routes(const Routes &) = delete;
  Routes &operator=(const Routes &) = delete;

  void register_routes(Server &server);

 private:
  std::shared_ptr<helpdesk_core::RetrievalPipeline> pipeline_;
  std::shared_ptr<helpdesk_core::TaskQueueRepo> task_queue_repo_;

  crow::response handle_chat_page(const crow::request &req);
  crow::response handle_health_check(const crow::request &req);
  crow::response handle_chat(const crow::request &req);
  crow::response handle_search(const crow::request &req);
  crow::response handle_stats(const crow::request &req);
  crow::response handle_forget_document(const crow::request &req, const std::string &document_id);

  crow::response handle_ingest(const crow::request &req);
  crow::response handle_list_tasks(const crow::request &req);
  crow::response handle_get_task(const crow::request &req, const std::string &task_id);
  crow::response handle_clear_completed_tasks(const crow::request &req);

  nlohmann::json create_success_response(const std::string &message,
                                         const nlohmann::json &data = nlohmann::json{});
  nlohmann::json create_error_response(const std::string &error);
  crow::response create_json_response(const nlohmann::json &json_data, int status_code = 200);
};

}  // namespace helpdesk_api
