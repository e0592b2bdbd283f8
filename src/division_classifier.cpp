#include "toc_outline/division_classifier.h"
#include "text_utils.h"

namespace toc_outline {

const char* division_name(Division division) {
    switch (division) {
        case Division::Common: return "common";
        case Division::Civil: return "civil";
        case Division::Architecture: return "architecture";
        case Division::Mechanical: return "mechanical";
        case Division::Maintenance: return "maintenance";
    }
    return "common";
}

const char* division_label(Division division) {
    switch (division) {
        case Division::Common: return "공통부문";
        case Division::Civil: return "토목부문";
        case Division::Architecture: return "건축부문";
        case Division::Mechanical: return "기계설비부문";
        case Division::Maintenance: return "유지관리부문";
    }
    return "공통부문";
}

std::vector<DivisionEntry> default_division_table() {
    return {
        // 공통부문
        {"적용기준", Division::Common},
        {"가설공사", Division::Common},
        {"토공사", Division::Common},
        {"조경공사", Division::Common},
        {"기초공사", Division::Common},
        {"철근콘크리트공사", Division::Common},
        {"돌공사", Division::Common},
        {"건설기계", Division::Common},
        // 토목부문
        {"도로포장공사", Division::Civil},
        {"하천공사", Division::Civil},
        {"터널공사", Division::Civil},
        {"궤도공사", Division::Civil},
        {"강구조공사", Division::Civil},
        {"관부설 및 접합공사", Division::Civil},
        {"항만공사", Division::Civil},
        {"지반조사", Division::Civil},
        {"측 량", Division::Civil},
        // 건축부문
        {"철골공사", Division::Architecture},
        {"조적공사", Division::Architecture},
        {"타일공사", Division::Architecture},
        {"목공사", Division::Architecture},
        {"수장공사", Division::Architecture},
        {"방수공사", Division::Architecture},
        {"지붕 및 홈통공사", Division::Architecture},
        {"금속공사", Division::Architecture},
        {"미장공사", Division::Architecture},
        {"창호 및 유리공사", Division::Architecture},
        {"칠공사", Division::Architecture},
        // 기계설비부문
        {"배관공사", Division::Mechanical},
        {"덕트공사", Division::Mechanical},
        {"보온공사", Division::Mechanical},
        {"펌프 및 공기설비공사", Division::Mechanical},
        {"밸브설비공사", Division::Mechanical},
        {"측정기기공사", Division::Mechanical},
        {"위생기구설비공사", Division::Mechanical},
        {"공기조화설비공사", Division::Mechanical},
        {"기타공사", Division::Mechanical},
        {"소방설비공사", Division::Mechanical},
        {"가스설비공사", Division::Mechanical},
        {"자동제어설비공사", Division::Mechanical},
        {"플랜트설비공사", Division::Mechanical},
        // 유지관리부문
        {"공 통", Division::Maintenance},
        {"토 목", Division::Maintenance},
        {"건 축", Division::Maintenance},
        {"기계설비", Division::Maintenance},
    };
}

DivisionClassifier::DivisionClassifier(std::vector<DivisionEntry> table) {
    for (auto& entry : table) {
        // first entry wins if a title is listed twice
        table_.emplace(text::collapse_whitespace(entry.title), entry.division);
    }
}

std::optional<Division> DivisionClassifier::lookup(const std::string& title) const {
    auto it = table_.find(text::collapse_whitespace(title));
    if (it == table_.end()) {
        return std::nullopt;
    }
    return it->second;
}

DivisionReport DivisionClassifier::classify(const std::vector<OutlineNode>& chapters,
                                            int last_known_page) const {
    if (last_known_page <= 0) {
        throw ContractError("last known page must be positive, got " +
                            std::to_string(last_known_page));
    }

    DivisionReport report;
    for (Division division : kAllDivisions) {
        report.spans[division].division = division;
    }

    for (const auto& chapter : chapters) {
        if (chapter.kind != NodeKind::Chapter) {
            throw ContractError("division classification expects chapter nodes, got " +
                                std::string(node_kind_name(chapter.kind)) + " '" +
                                chapter.title + "'");
        }

        auto division = lookup(chapter.title);
        if (!division) {
            report.unclassified.push_back(chapter);
            report.diagnostics.push_back(Diagnostic{
                DiagnosticKind::UnclassifiedChapter, chapter.page, display_title(chapter),
                "chapter title '" + chapter.title + "' is not in the division table"});
            continue;
        }

        DivisionSpan& span = report.spans[*division];
        if (!span.start_page) {
            span.start_page = chapter.page;
        }
        span.chapters.push_back(chapter);
    }

    // Backward pass: each populated division ends where the next populated one starts.
    std::optional<int> next_start;
    for (auto it = kAllDivisions.rbegin(); it != kAllDivisions.rend(); ++it) {
        DivisionSpan& span = report.spans[*it];
        if (!span.start_page) {
            continue;
        }

        int end = next_start ? *next_start - 1 : last_known_page;
        if (end < *span.start_page) {
            report.diagnostics.push_back(Diagnostic{
                DiagnosticKind::DivisionOutOfOrder, *span.start_page, division_label(*it),
                std::string(division_label(*it)) + " starts at page " +
                    std::to_string(*span.start_page) + " but must end by page " +
                    std::to_string(end) + "; span collapsed to its first page"});
            end = *span.start_page;
        }
        span.end_page = end;
        next_start = span.start_page;
    }

    return report;
}

DivisionReport classify_divisions(const std::vector<OutlineNode>& chapters, int last_known_page) {
    static const DivisionClassifier classifier;
    return classifier.classify(chapters, last_known_page);
}

} // namespace toc_outline
