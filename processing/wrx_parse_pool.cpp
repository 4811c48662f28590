#include "wrx_parse_pool.h"
#include <algorithm>
#include <iostream>
#include <set>

bool wrx_parse_summary::has_warnings(wrx_water_right_no no) const
{
  return std::any_of(warnings.begin(), warnings.end(),
    [no](const wrx_warning& w) { return w.water_right_no == no; });
}

std::vector<wrx_warning> wrx_parse_summary::warnings_for(wrx_water_right_no no) const
{
  std::vector<wrx_warning> out;
  for (const auto& w : warnings) {
    if (w.water_right_no == no) {
      out.push_back(w);
    }
  }
  return out;
}

std::vector<wrx_water_right_no> wrx_parse_summary::fully_parsed() const
{
  std::set<wrx_water_right_no> warned;
  for (const auto& w : warnings) {
    warned.insert(w.water_right_no);
  }

  std::vector<wrx_water_right_no> out;
  for (const auto& water_right : enriched) {
    if (warned.find(water_right.no) == warned.end()) {
      out.push_back(water_right.no);
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

std::vector<wrx_water_right_no> wrx_parse_summary::parsed_with_warnings() const
{
  std::set<wrx_water_right_no> warned;
  for (const auto& w : warnings) {
    warned.insert(w.water_right_no);
  }

  std::vector<wrx_water_right_no> out;
  for (const auto* list : { &enriched, &pdf_only }) {
    for (const auto& water_right : *list) {
      if (warned.find(water_right.no) != warned.end()) {
        out.push_back(water_right.no);
      }
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

wrx_parse_pool::wrx_parse_pool(const wrx_parser_config& config, const wrx_enrichment_table& table)
  : parser_(config)
  , table_(table)
  , worker_count_(config.workers)
  , processed_(0)
{
  if (worker_count_ == 0) {
    worker_count_ = std::max(1u, std::thread::hardware_concurrency());
  }
}

wrx_parse_pool::~wrx_parse_pool()
{
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    closed_ = true;
  }
  queue_cv_.notify_all();

  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

void wrx_parse_pool::start()
{
  std::lock_guard<std::mutex> lock(queue_mutex_);
  if (running_) {
    return;
  }
  running_ = true;

  if (parser_.get_config().verbose) {
    std::cout << "[POOL] Starting " << worker_count_ << " workers, "
              << jobs_.size() << " reports queued" << std::endl;
  }

  for (unsigned i = 0; i < worker_count_; ++i) {
    workers_.emplace_back(&wrx_parse_pool::worker_loop, this);
  }
}

void wrx_parse_pool::submit_file(wrx_water_right_no no, const wrx_string& path)
{
  job next;
  next.no = no;
  next.from = job::source::file;
  next.path = path;
  enqueue(std::move(next));
}

void wrx_parse_pool::submit_document(wrx_water_right_no no, wrx_pdf_document&& document)
{
  job next;
  next.no = no;
  next.from = job::source::document;
  next.document = std::move(document);
  enqueue(std::move(next));
}

void wrx_parse_pool::submit_pages(wrx_water_right_no no, std::vector<wrx_page_events> pages)
{
  job next;
  next.no = no;
  next.from = job::source::pages;
  next.pages = std::move(pages);
  enqueue(std::move(next));
}

void wrx_parse_pool::enqueue(job&& next)
{
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (closed_) {
      std::cerr << "[POOL] Pool already finished, report " << next.no << " dropped" << std::endl;
      return;
    }
    jobs_.push_back(std::move(next));
  }
  queue_cv_.notify_one();
}

wrx_parse_summary wrx_parse_pool::finish()
{
  start();

  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    closed_ = true;
  }
  queue_cv_.notify_all();

  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }

  std::lock_guard<std::mutex> lock(summary_mutex_);
  std::sort(summary_.enriched.begin(), summary_.enriched.end(),
    [](const wrx_water_right& a, const wrx_water_right& b) { return a.no < b.no; });
  std::sort(summary_.pdf_only.begin(), summary_.pdf_only.end(),
    [](const wrx_water_right& a, const wrx_water_right& b) { return a.no < b.no; });
  std::stable_sort(summary_.warnings.begin(), summary_.warnings.end(),
    [](const wrx_warning& a, const wrx_warning& b) { return a.water_right_no < b.water_right_no; });

  std::cout << "[POOL] Parsed " << summary_.parsed_count() << " reports ("
            << summary_.enriched.size() << " enriched, " << summary_.pdf_only.size() << " pdf only), "
            << summary_.failed.size() << " failed, " << summary_.broken.size() << " broken, "
            << summary_.warnings.size() << " warnings" << std::endl;

  return std::move(summary_);
}

wrx_parse_summary wrx_parse_pool::run()
{
  start();
  return finish();
}

void wrx_parse_pool::worker_loop()
{
  while (true) {
    job next;
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      queue_cv_.wait(lock, [this] { return closed_ || !jobs_.empty(); });
      if (jobs_.empty()) {
        // closed and drained
        return;
      }
      next = std::move(jobs_.front());
      jobs_.pop_front();
    }

    process(next);
    processed_++;
  }
}

void wrx_parse_pool::process(job& next)
{
  wrx_warnings warnings(next.no);
  std::optional<wrx_water_right> water_right;
  bool enriched = false;
  bool broken = false;
  wrx_string error;

  try {
    if (next.from == job::source::file) {
      next.document.load_file(next.path);
      next.from = job::source::document;
    }

    if (next.from == job::source::document) {
      water_right = parser_.parse(next.no, next.document, warnings);
    } else {
      water_right = parser_.parse(next.no, next.pages, warnings);
    }

    enriched = table_.enrich(*water_right, warnings);
    if (!enriched && parser_.get_config().verbose) {
      std::cout << "[ENRICH] Report " << next.no << " has no table rows, keeping PDF values only" << std::endl;
    }
    post_process(*water_right, warnings);
  } catch (const wrx_load_error& e) {
    broken = true;
    error = e.what();
    water_right.reset();
  } catch (const wrx_exception& e) {
    error = e.what();
    water_right.reset();
  } catch (const std::exception& e) {
    error = wrx_string("unexpected error: ") + e.what();
    water_right.reset();
  }

  if (!water_right) {
    std::cerr << "[POOL] Report " << next.no << (broken ? " could not be loaded: " : " could not be parsed: ")
              << error << std::endl;
  } else if (parser_.get_config().verbose) {
    std::cout << "[POOL] Report " << next.no << " parsed, " << water_right->usage_location_count()
              << " usage locations, " << warnings.size() << " warnings" << std::endl;
  }

  std::lock_guard<std::mutex> lock(summary_mutex_);
  for (auto& warning : warnings.take()) {
    summary_.warnings.push_back(std::move(warning));
  }

  if (!water_right) {
    if (broken) {
      summary_.broken[next.no] = error;
    } else {
      summary_.failed[next.no] = error;
    }
  } else if (enriched) {
    summary_.enriched.push_back(std::move(*water_right));
  } else {
    summary_.pdf_only.push_back(std::move(*water_right));
  }
}
