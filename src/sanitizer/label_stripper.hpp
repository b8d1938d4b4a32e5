#pragma once

// ---------------------------------------------------------------------------
// label_stripper.hpp
//
// 추출 파이프라인 1단계: 마크다운 펜스와 선행 라벨 그룹 제거.
//
// [제거 대상]
// - 모든 코드 펜스 (```sql, ```SQL, ``` 등)와 그 뒤 공백. 내부 내용은 유지.
// - 텍스트 시작의 라벨 그룹:
//     SQLQuery: / SQL Query: / Answer:  → 라벨만 제거
//     Question: / SQLResult:            → 다음 라벨 직전까지 섹션 통째로 제거
//
// [비제거 대상]
// - 본문 중간의 라벨은 건드리지 않는다. 중간 라벨은 trailing_truncator 가
//   절단 지점으로 사용한다.
//
// 실패하지 않는다. 라벨이 없으면 입력을 그대로 돌려준다.
// ---------------------------------------------------------------------------

#include <string>
#include <string_view>

[[nodiscard]] std::string strip_labels(std::string_view text);
