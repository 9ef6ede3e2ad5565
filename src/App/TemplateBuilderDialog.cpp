#include "TemplateBuilderDialog.h"
#include <wx/sizer.h>
#include <wx/panel.h>
#include <wx/scrolwin.h>
#include <wx/stattext.h>
#include <wx/textctrl.h>
#include <wx/button.h>
#include <wx/valtext.h>
#include <wx/msgdlg.h>
#include <wx/utils.h>
#include <wx/settings.h>
#include <wx/cursor.h>

#include <algorithm>
#include <string>

namespace
{
	const int CellHeight = 30;

	// Characters a separator entry accepts as they are typed
	wxArrayString SeparatorCharacters()
	{
		wxArrayString chars;
		for (char c = 'a'; c <= 'z'; ++c)
			chars.Add(wxString(c));
		for (char c = 'A'; c <= 'Z'; ++c)
			chars.Add(wxString(c));
		for (char c = '0'; c <= '9'; ++c)
			chars.Add(wxString(c));
		for (char c : BatchRenamerLogic::AllowedSeparatorPunctuation)
			chars.Add(wxString(c));
		return chars;
	}
}

TemplateBuilderDialog::TemplateBuilderDialog(wxWindow *parent, const TemplateBuilder &builder)
	: wxDialog(parent, wxID_ANY, "Define Output Format", wxDefaultPosition, wxDefaultSize, wxDEFAULT_DIALOG_STYLE | wxRESIZE_BORDER),
	  m_builder(builder),
	  m_dragIndex(-1)
{
	const int cellWidth = TemplateBuilder::DefaultCellWidth;
	const int fieldCount = (int)m_builder.FieldCount();

	wxBoxSizer *mainSizer = new wxBoxSizer(wxVERTICAL);
	mainSizer->Add(new wxStaticText(this, wxID_ANY,
									"Drag the columns into the desired order and type the separators between them.\n"
									"Separators accept letters, digits and \"" +
										wxString(BatchRenamerLogic::AllowedSeparatorPunctuation) + "\"."),
				   0, wxALL, 10);

	// Markers sit at even cells and separator entries at odd cells, each one cell wide
	canvas = new wxScrolledWindow(this, wxID_ANY, wxDefaultPosition, wxSize(-1, CellHeight + 25), wxHSCROLL | wxBORDER_SUNKEN);
	wxTextValidator separatorValidator(wxFILTER_INCLUDE_CHAR_LIST);
	separatorValidator.SetIncludes(SeparatorCharacters());
	for (int i = 0; i < fieldCount; ++i)
	{
		wxPanel *marker = new wxPanel(canvas, wxID_ANY, wxPoint(2 * i * cellWidth, 2), wxSize(cellWidth - 4, CellHeight), wxBORDER_RAISED);
		marker->SetBackgroundColour(wxSystemSettings::GetColour(wxSYS_COLOUR_BTNFACE));
		marker->SetCursor(wxCursor(wxCURSOR_HAND));
		wxStaticText *label = new wxStaticText(marker, wxID_ANY, "", wxPoint(4, 6), wxSize(cellWidth - 12, -1), wxST_ELLIPSIZE_END);
		BindMarker(marker, (std::size_t)i);
		BindMarker(label, (std::size_t)i);
		m_markers.push_back(marker);
		m_markerLabels.push_back(label);

		if (i + 1 < fieldCount)
		{
			wxTextCtrl *entry = new wxTextCtrl(canvas, wxID_ANY, "", wxPoint((2 * i + 1) * cellWidth, 2), wxSize(cellWidth - 4, CellHeight), 0, separatorValidator);
			const std::size_t slot = (std::size_t)i;
			entry->Bind(wxEVT_TEXT, [this, slot](wxCommandEvent &)
						{ OnSeparatorText(slot); });
			m_separatorCtrls.push_back(entry);
		}
	}
	new wxStaticText(canvas, wxID_ANY, wxString::FromUTF8(m_builder.Extension()), wxPoint((2 * fieldCount - 1) * cellWidth + 4, 8));
	canvas->SetVirtualSize(2 * fieldCount * cellWidth, CellHeight + 4);
	canvas->SetScrollRate(10, 0);
	canvas->Bind(wxEVT_LEFT_UP, &TemplateBuilderDialog::OnMarkerUp, this);
	mainSizer->Add(canvas, 0, wxEXPAND | wxLEFT | wxRIGHT, 10);

	previewLabel = new wxStaticText(this, wxID_ANY, "");
	mainSizer->Add(previewLabel, 0, wxALL, 10);

	wxStdDialogButtonSizer *buttonSizer = new wxStdDialogButtonSizer();
	wxButton *acceptButton = new wxButton(this, wxID_OK, "Accept");
	buttonSizer->AddButton(acceptButton);
	buttonSizer->AddButton(new wxButton(this, wxID_CANCEL));
	buttonSizer->Realize();
	mainSizer->Add(buttonSizer, 0, wxALIGN_CENTER_HORIZONTAL | wxBOTTOM, 10);

	SetSizer(mainSizer);
	mainSizer->SetSizeHints(this);
	SetInitialSize(wxSize(std::min(2 * fieldCount * cellWidth + 40, 1000), -1));
	Centre(wxBOTH);

	RefreshMarkers();
	Bind(wxEVT_BUTTON, &TemplateBuilderDialog::OnAccept, this, wxID_OK);
}

void TemplateBuilderDialog::BindMarker(wxWindow *window, std::size_t index)
{
	window->Bind(wxEVT_LEFT_DOWN, [this, index](wxMouseEvent &)
				 { OnMarkerDown(index); });
	window->Bind(wxEVT_LEFT_UP, &TemplateBuilderDialog::OnMarkerUp, this);
	window->Bind(wxEVT_MOUSE_CAPTURE_LOST, &TemplateBuilderDialog::OnCaptureLost, this);
}

void TemplateBuilderDialog::OnMarkerDown(std::size_t index)
{
	m_dragIndex = (int)index;
	m_markers[index]->CaptureMouse();
	canvas->SetCursor(wxCursor(wxCURSOR_SIZEWE));
}

// Drop position is read from the pointer, so it does not matter which window got the release
void TemplateBuilderDialog::OnMarkerUp(wxMouseEvent &event)
{
	if (m_dragIndex < 0)
	{
		event.Skip();
		return;
	}
	const std::size_t from = (std::size_t)m_dragIndex;
	EndDrag();

	wxPoint dropPoint = canvas->CalcUnscrolledPosition(canvas->ScreenToClient(wxGetMousePosition()));
	if (m_builder.DropField(from, dropPoint.x, TemplateBuilder::DefaultCellWidth))
	{
		RefreshMarkers();
	}
}

void TemplateBuilderDialog::OnCaptureLost(wxMouseCaptureLostEvent &WXUNUSED(event))
{
	m_dragIndex = -1;
	canvas->SetCursor(wxNullCursor);
}

void TemplateBuilderDialog::EndDrag()
{
	if (m_dragIndex >= 0 && m_markers[(std::size_t)m_dragIndex]->HasCapture())
	{
		m_markers[(std::size_t)m_dragIndex]->ReleaseMouse();
	}
	m_dragIndex = -1;
	canvas->SetCursor(wxNullCursor);
}

// Pasted text bypasses the validator's key filter, so the builder has the last word
void TemplateBuilderDialog::OnSeparatorText(std::size_t slot)
{
	wxTextCtrl *entry = m_separatorCtrls[slot];
	if (!m_builder.SetSeparator(slot, std::string(entry->GetValue().utf8_str())))
	{
		wxBell();
		entry->ChangeValue(wxString::FromUTF8(m_builder.Separator(slot)));
		entry->SetInsertionPointEnd();
	}
	RefreshPreview();
}

void TemplateBuilderDialog::OnAccept(wxCommandEvent &WXUNUSED(event))
{
	NameTemplate nameTemplate = m_builder.Build();
	if (nameTemplate.IsEmpty())
	{
		EndModal(wxID_CANCEL);
		return;
	}
	wxString message = "Use the following filename format?\n\n" + wxString::FromUTF8(nameTemplate.ToString());
	if (wxMessageBox(message, "Confirm Format", wxYES_NO | wxICON_QUESTION | wxCENTRE, this) == wxYES)
	{
		EndModal(wxID_OK);
	}
}

void TemplateBuilderDialog::RefreshMarkers()
{
	const std::vector<std::string> &fields = m_builder.Fields();
	for (std::size_t i = 0; i < m_markerLabels.size() && i < fields.size(); ++i)
	{
		m_markerLabels[i]->SetLabel(wxString::FromUTF8(fields[i]));
		m_markers[i]->SetToolTip(wxString::FromUTF8(fields[i]));
	}
	RefreshPreview();
}

void TemplateBuilderDialog::RefreshPreview()
{
	previewLabel->SetLabel("Final name: " + wxString::FromUTF8(m_builder.Build().ToString()));
	Layout();
}
