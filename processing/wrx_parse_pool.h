#ifndef WRX_PARSE_POOL_H
#define WRX_PARSE_POOL_H

#include "../enrichment/wrx_enrichment_table.h"
#include "../parse/wrx_document_parser.h"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

// ============================================================================
// PARSE POOL - one report per task, results merged into a summary
// ============================================================================
//
// Workers pull reports from a queue and run, per report:
//
//   load (files only) -> parse -> enrich -> post_process
//
// Each task owns its warning list. The summary is the only state the
// workers share and is merged under summary_mutex_.
//
// Usage:
//   wrx_parse_pool pool(config, table);
//   pool.start();
//   pool.submit_file(4711, "reports/rep4711.pdf");
//   wrx_parse_summary summary = pool.finish();   // joins all workers
//
// ============================================================================

struct wrx_parse_summary
{
  std::vector<wrx_water_right> enriched;                 // table rows found
  std::vector<wrx_water_right> pdf_only;                 // parsed from the report alone
  std::map<wrx_water_right_no, wrx_string> failed;       // parse errors
  std::map<wrx_water_right_no, wrx_string> broken;       // reports that did not load
  std::vector<wrx_warning> warnings;

  bool has_warnings(wrx_water_right_no no) const;
  std::vector<wrx_warning> warnings_for(wrx_water_right_no no) const;

  // Enriched reports without a single warning
  std::vector<wrx_water_right_no> fully_parsed() const;
  // Parsed reports, enriched or not, with at least one warning
  std::vector<wrx_water_right_no> parsed_with_warnings() const;

  size_t parsed_count() const { return enriched.size() + pdf_only.size(); }
  size_t total() const { return parsed_count() + failed.size() + broken.size(); }
};

class wrx_parse_pool
{
public:
  wrx_parse_pool(const wrx_parser_config& config, const wrx_enrichment_table& table);
  ~wrx_parse_pool();

  wrx_parse_pool(const wrx_parse_pool&) = delete;
  wrx_parse_pool& operator=(const wrx_parse_pool&) = delete;

  // Launches the workers, submitting before start() just queues
  void start();

  void submit_file(wrx_water_right_no no, const wrx_string& path);
  void submit_document(wrx_water_right_no no, wrx_pdf_document&& document);
  void submit_pages(wrx_water_right_no no, std::vector<wrx_page_events> pages);

  // Drains the queue, joins the workers and hands out the summary
  wrx_parse_summary finish();

  // start() + finish() for a queue filled up front
  wrx_parse_summary run();

  unsigned worker_count() const { return worker_count_; }
  size_t processed_count() const { return processed_; }

private:
  struct job
  {
    enum class source { file, document, pages };

    wrx_water_right_no no = 0;
    source from = source::pages;
    wrx_string path;
    wrx_pdf_document document;
    std::vector<wrx_page_events> pages;
  };

  void enqueue(job&& next);
  void worker_loop();
  void process(job& next);

  wrx_document_parser parser_;
  const wrx_enrichment_table& table_;
  unsigned worker_count_;

  std::deque<job> jobs_;
  std::vector<std::thread> workers_;
  bool running_ = false;
  bool closed_ = false;
  std::mutex queue_mutex_;
  std::condition_variable queue_cv_;

  wrx_parse_summary summary_;
  std::mutex summary_mutex_;
  std::atomic<size_t> processed_;
};

#endif // WRX_PARSE_POOL_H
