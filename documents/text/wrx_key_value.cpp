#include "wrx_key_value.h"

wrx_key_value_grouper::wrx_key_value_grouper(const wrx_font_roles& roles, wrx_warnings& warnings)
  : roles(roles), warnings(warnings)
{
}

wrx_key_values wrx_key_value_grouper::group(std::vector<wrx_text_block> blocks) const
{
  wrx_key_values pairs;
  wrx_column_index columns;
  bool has_label_on_page = false;
  size_t current_page = 0;

  for (auto& block : blocks) {
    if (!block.font_family || !block.content) {
      continue;
    }

    if (block.page != current_page) {
      current_page = block.page;
      has_label_on_page = false;
    }

    switch (roles.role_of(*block.font_family)) {
      case wrx_font_role::label:
        pairs.emplace_back(std::move(*block.content), std::vector<wrx_string>());
        has_label_on_page = true;
        if (block.x) {
          columns.record(*block.x, pairs.size() - 1);
        }
        break;

      case wrx_font_role::value: {
        if (pairs.empty()) {
          warnings.add(wrx_warning_kind::value_without_label,
                       "value without label on page " + wrx_string(std::to_string(block.page + 1)) +
                       " dropped: " + *block.content);
          break;
        }

        // a fragment opening a page in a label column continues that label's value
        size_t index = 0;
        if (!has_label_on_page && block.x && columns.lookup(*block.x, index)) {
          auto& values = pairs[index].second;
          if (values.empty()) {
            values.push_back(std::move(*block.content));
          } else {
            values.back() += wrx_string(" ") + *block.content;
          }
          break;
        }

        pairs.back().second.push_back(std::move(*block.content));
        break;
      }

      case wrx_font_role::none:
        break;
    }
  }

  return pairs;
}
