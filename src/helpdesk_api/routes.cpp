#include "helpdesk_api/routes.hpp"

#include <iostream>
#include <nlohmann/json.hpp>

#include "chat_page.hpp"
#include "helpdesk_api/payloads.hpp"
#include "helpdesk_core/db/task_queue_repo.hpp"
#include "helpdesk_core/errors.hpp"
#include "helpdesk_core/services/retrieval_pipeline.hpp"

namespace helpdesk_api {
Routes::Routes(std::shared_ptr<helpdesk_core::RetrievalPipeline> pipeline,
               std::shared_ptr<helpdesk_core::TaskQueueRepo> task_queue_repo)
    : pipeline_(pipeline), task_queue_repo_(task_queue_repo) {}

void Routes::register_routes(Server &server) {
  auto &app = server.get_app();

  CROW_ROUTE(app, "/")
  ([this](const crow::request &req) { return handle_chat_page(req); });

  CROW_ROUTE(app, "/healthz")
  ([this](const crow::request &req) { return handle_health_check(req); });

  CROW_ROUTE(app, "/api/chat").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_chat(req);
  });

  CROW_ROUTE(app, "/api/search").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_search(req);
  });

  CROW_ROUTE(app, "/api/stats")
  ([this](const crow::request &req) { return handle_stats(req); });

  CROW_ROUTE(app, "/api/documents/<string>")
      .methods(crow::HTTPMethod::DELETE)(
          [this](const crow::request &req, const std::string &document_id) {
            return handle_forget_document(req, document_id);
          });

  // Ingest task endpoints
  CROW_ROUTE(app, "/api/ingest").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_ingest(req);
  });

  CROW_ROUTE(app, "/api/tasks")
  ([this](const crow::request &req) { return handle_list_tasks(req); });

  CROW_ROUTE(app, "/api/tasks/<string>")
  ([this](const crow::request &req, const std::string &task_id) {
    return handle_get_task(req, task_id);
  });

  CROW_ROUTE(app, "/api/tasks/clear")
      .methods(crow::HTTPMethod::POST)(
          [this](const crow::request &req) { return handle_clear_completed_tasks(req); });
}

crow::response Routes::handle_chat_page(const crow::request &req) {
  crow::response resp(200, kChatPageHtml);
  resp.add_header("Content-Type", "text/html; charset=utf-8");
  return resp;
}

crow::response Routes::handle_health_check(const crow::request &req) {
  nlohmann::json response;
  response["status"] = "ok";
  return create_json_response(response);
}

crow::response Routes::handle_chat(const crow::request &req) {
  try {
    ChatRequest request = parse_chat_request(req.body);
    std::cout << "[API] Chat question (top_k: " << request.top_k.value_or(0) << ")" << std::endl;

    helpdesk_core::Answer answer = pipeline_->ask(request.question, request.top_k);
    return create_json_response(answer_to_json(answer));
  } catch (const BadRequest &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const std::invalid_argument &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const helpdesk_core::ProviderError &e) {
    std::cerr << "[API] Provider failure in handle_chat: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 502);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_chat: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_search(const crow::request &req) {
  try {
    SearchRequest request = parse_search_request(req.body);
    std::cout << "[API] Search for: " << request.query << std::endl;

    auto results = pipeline_->retrieve(request.query, request.top_k, request.min_score);
    nlohmann::json results_json = nlohmann::json::array();
    for (const auto &result : results) {
      results_json.push_back(reference_to_json(result));
    }

    nlohmann::json response = create_success_response("Search completed");
    response["data"]["results"] = results_json;
    response["data"]["count"] = results_json.size();
    return create_json_response(response);
  } catch (const BadRequest &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const std::invalid_argument &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const helpdesk_core::ProviderError &e) {
    std::cerr << "[API] Provider failure in handle_search: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 502);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_search: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_stats(const crow::request &req) {
  try {
    nlohmann::json response = create_success_response("Store statistics");
    response["data"] = stats_to_json(pipeline_->stats());
    return create_json_response(response);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_stats: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_forget_document(const crow::request &req,
                                              const std::string &document_id) {
  try {
    std::cout << "[API] Forgetting document: " << document_id << std::endl;
    size_t removed = pipeline_->forget(document_id);
    if (removed == 0) {
      return create_json_response(create_error_response("Document not found"), 404);
    }
    nlohmann::json response = create_success_response("Document removed");
    response["data"]["removed_records"] = removed;
    return create_json_response(response);
  } catch (const helpdesk_core::CorruptStoreError &e) {
    return create_json_response(create_error_response(e.what()), 409);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_forget_document: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

// ============================================================================
// Ingest Task Route Handlers
// ============================================================================

crow::response Routes::handle_ingest(const crow::request &req) {
  try {
    IngestRequest request = parse_ingest_request(req.body);
    const std::string kind = helpdesk_core::to_string(request.kind);
    long long task_id = task_queue_repo_->create_ingest_task(kind, request.payload.dump());
    std::cout << "[API] Queued " << kind << " ingest as task " << task_id << std::endl;

    nlohmann::json response = create_success_response("Ingest task queued");
    response["data"]["task_id"] = task_id;
    response["data"]["kind"] = kind;
    response["data"]["source"] = request.payload;
    return create_json_response(response, 202);
  } catch (const BadRequest &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_ingest: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_list_tasks(const crow::request &req) {
  try {
    const char *status_param = req.url_params.get("status");
    std::vector<helpdesk_core::IngestTaskRecord> tasks;

    if (status_param != nullptr && *status_param != '\0') {
      helpdesk_core::TaskStatus status;
      try {
        status = helpdesk_core::task_status_from_string(status_param);
      } catch (const std::invalid_argument &) {
        return create_json_response(
            create_error_response(std::string("Invalid status filter: ") + status_param), 400);
      }
      tasks = task_queue_repo_->get_tasks_by_status(status);
    } else {
      tasks = task_queue_repo_->list_recent_tasks();
    }

    nlohmann::json tasks_json = nlohmann::json::array();
    for (const auto &task : tasks) {
      tasks_json.push_back(task_to_json(task, std::nullopt));
    }

    nlohmann::json response = create_success_response("Tasks retrieved successfully");
    response["data"]["tasks"] = tasks_json;
    response["data"]["count"] = tasks_json.size();
    return create_json_response(response);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_list_tasks: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_get_task(const crow::request &req, const std::string &task_id) {
  long long id = 0;
  try {
    size_t consumed = 0;
    id = std::stoll(task_id, &consumed);
    if (consumed != task_id.size()) {
      throw std::invalid_argument(task_id);
    }
  } catch (const std::exception &) {
    return create_json_response(create_error_response("Invalid task ID format"), 400);
  }

  try {
    auto task = task_queue_repo_->get_task(id);
    if (!task.has_value()) {
      return create_json_response(create_error_response("Task not found"), 404);
    }
    nlohmann::json response = create_success_response("Task status retrieved successfully");
    response["data"] = task_to_json(*task, task_queue_repo_->get_task_progress(id));
    return create_json_response(response);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_get_task: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_clear_completed_tasks(const crow::request &req) {
  int older_than_days = 7;
  if (!req.body.empty()) {
    nlohmann::json body = nlohmann::json::parse(req.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
      return create_json_response(create_error_response("Request body must be a JSON object"),
                                  400);
    }
    if (body.contains("older_than_days")) {
      if (!body["older_than_days"].is_number_integer() || body["older_than_days"].get<int>() < 0) {
        return create_json_response(
            create_error_response("'older_than_days' must be a non-negative integer"), 400);
      }
      older_than_days = body["older_than_days"].get<int>();
    }
  }

  try {
    task_queue_repo_->clear_completed_tasks(older_than_days);
    nlohmann::json response = create_success_response("Completed tasks cleared successfully");
    response["data"]["older_than_days"] = older_than_days;
    return create_json_response(response);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_clear_completed_tasks: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::create_json_response(const nlohmann::json &json_data, int status_code) {
  crow::response resp(status_code, json_data.dump(2));
  resp.add_header("Content-Type", "application/json");
  return resp;
}

nlohmann::json Routes::create_success_response(const std::string &message,
                                               const nlohmann::json &data) {
  nlohmann::json response;
  response["success"] = true;
  response["message"] = message;
  if (!data.is_null()) {
    response["data"] = data;
  }
  return response;
}

nlohmann::json Routes::create_error_response(const std::string &error) {
  nlohmann::json response;
  response["success"] = false;
  response["error"] = error;
  return response;
}

}  // namespace helpdesk_api
